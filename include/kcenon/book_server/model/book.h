// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

/**
 * @file book.h
 * @brief Book entity, request shapes and field validation
 *
 * Defines the record stored in the `book` table together with the input
 * shapes accepted by the service:
 * - book_create: creation request; required fields are optional so that a
 *   missing field is representable and can be rejected by validation
 * - book_update: partial update; std::nullopt means "absent, leave untouched"
 * - book_fields: a validated, normalized creation payload
 *
 * Validation trims surrounding whitespace, rejects control characters and
 * malformed UTF-8, and enforces the column limits in code points before
 * anything reaches storage. The result is a tagged
 * kcenon::common::Result; failures carry error_kind::validation_error and a
 * message listing every violated rule.
 *
 * ## Thread Safety
 * Plain value types; validation functions are pure.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <kcenon/common/patterns/result.h>

namespace book_server::model
{

/// Microsecond-precision UTC instant, the unit persisted in the table.
using timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

/// Limits count UTF-8 code points, matching SQLite length() on TEXT.
inline constexpr std::size_t max_title_length = 200;
inline constexpr std::size_t max_author_length = 100;
inline constexpr std::size_t max_publication_length = 100;

/**
 * @struct book
 * @brief A stored book record
 */
struct book
{
	std::string uid;                        ///< Server-generated UUID, immutable
	std::string title;                      ///< Never empty
	std::string author;                     ///< Never empty
	std::optional<std::string> publication; ///< Publication house, nullable
	double price = 0.0;                     ///< Always >= 0
	timestamp created_at;                   ///< Set once at creation
	timestamp updated_at;                   ///< >= created_at, advances on mutation
};

/**
 * @struct book_create
 * @brief Creation request as received from a caller
 */
struct book_create
{
	std::optional<std::string> title;
	std::optional<std::string> author;
	std::optional<std::string> publication;
	std::optional<double> price;
};

/**
 * @struct book_fields
 * @brief Validated and trimmed creation payload handed to the store
 */
struct book_fields
{
	std::string title;
	std::string author;
	std::optional<std::string> publication;
	double price = 0.0;
};

/**
 * @struct book_update
 * @brief Partial update request
 *
 * Each member is present only when the caller supplied it. publication has
 * two levels: the outer optional is presence, an inner std::nullopt clears
 * the column to NULL.
 */
struct book_update
{
	std::optional<std::string> title;
	std::optional<std::string> author;
	std::optional<std::optional<std::string>> publication;
	std::optional<double> price;

	/**
	 * @brief Check whether no field is present
	 * @return true if applying this update would change nothing
	 */
	[[nodiscard]] bool empty() const noexcept
	{
		return !title && !author && !publication && !price;
	}
};

/**
 * @struct book_page
 * @brief One pagination window of the creation-ordered book sequence
 */
struct book_page
{
	std::vector<book> books;
	uint64_t total_count = 0; ///< Rows in the table, independent of the window
	uint64_t skip = 0;        ///< Normalized skip actually applied
	uint64_t limit = 0;       ///< Normalized limit actually applied
};

/**
 * @brief Validate and normalize a creation request
 * @param request Raw creation request
 * @return Trimmed fields, or validation_error listing every violation
 */
[[nodiscard]] kcenon::common::Result<book_fields> validate(const book_create& request);

/**
 * @brief Validate and normalize the present fields of an update
 * @param request Raw update request
 * @return Trimmed update, or validation_error listing every violation
 */
[[nodiscard]] kcenon::common::Result<book_update> validate(const book_update& request);

/**
 * @brief Current wall-clock time truncated to microseconds
 */
[[nodiscard]] timestamp now();

[[nodiscard]] int64_t to_microseconds(timestamp value) noexcept;

[[nodiscard]] timestamp from_microseconds(int64_t value) noexcept;

/**
 * @brief Render a timestamp as ISO-8601 UTC text
 * @param value Timestamp to format
 * @return Text such as "2024-01-15T10:30:00.000000Z"
 */
[[nodiscard]] std::string to_iso8601(timestamp value);

} // namespace book_server::model
