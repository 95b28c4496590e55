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
 * @file book_service.h
 * @brief Book resource operations
 *
 * The service validates input, normalizes pagination and runs each
 * operation as one unit of work through the session manager. Store errors
 * pass through unchanged; nothing is retried.
 *
 * ### Example Usage
 * @code
 * book_server::service::book_service books(sessions, {}, logger);
 *
 * book_server::model::book_create request;
 * request.title = "The Hobbit";
 * request.author = "J.R.R. Tolkien";
 * request.price = 12.5;
 *
 * auto created = books.create_book(request);
 * if (created.is_ok()) {
 *     auto page = books.list_books(0, 10);
 * }
 * @endcode
 */

#pragma once

#include <kcenon/book_server/model/book.h>
#include <kcenon/book_server/session/session_manager.h>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <kcenon/thread/core/cancellation_token.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace book_server::service
{

/**
 * @struct service_config
 * @brief Pagination limits of the list operation
 */
struct service_config
{
	uint64_t default_page_size = 100; ///< Limit used when the caller gives none
	uint64_t max_page_size = 1000;    ///< Upper clamp for any limit
};

/**
 * @struct page_window
 * @brief Normalized pagination window
 */
struct page_window
{
	uint64_t skip = 0;
	uint64_t limit = 0;
};

/**
 * @class book_service
 * @brief CRUD operations on books, one transaction per call
 *
 * ### Thread Safety
 * All operations may be called concurrently.
 */
class book_service
{
public:
	book_service(std::shared_ptr<session::session_manager> sessions,
				 service_config config = {},
				 std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	/**
	 * @brief Create the book table and indexes if missing
	 */
	kcenon::common::VoidResult initialize_schema();

	/**
	 * @brief Validate and persist a new book
	 * @return Stored book, validation_error or storage_error
	 */
	kcenon::common::Result<model::book> create_book(
		const model::book_create& request,
		const kcenon::thread::cancellation_token* token = nullptr);

	/**
	 * @brief Fetch a book by uid
	 * @return Book, not_found or storage_error
	 */
	kcenon::common::Result<model::book> get_book(
		std::string_view uid, const kcenon::thread::cancellation_token* token = nullptr);

	/**
	 * @brief List books in creation order
	 * @param skip Records to skip; negative values are treated as 0
	 * @param limit Page size; std::nullopt selects default_page_size,
	 *        out-of-range values are clamped to [1, max_page_size]
	 * @return Page with the normalized window and the total count
	 */
	kcenon::common::Result<model::book_page> list_books(
		int64_t skip,
		std::optional<int64_t> limit = std::nullopt,
		const kcenon::thread::cancellation_token* token = nullptr);

	/**
	 * @brief Apply a partial update
	 *
	 * Only fields present in the request change. An empty request returns
	 * the current book without writing.
	 *
	 * @return Merged book, validation_error, not_found or storage_error
	 */
	kcenon::common::Result<model::book> update_book(
		std::string_view uid,
		const model::book_update& request,
		const kcenon::thread::cancellation_token* token = nullptr);

	/**
	 * @brief Delete a book
	 * @return ok, not_found or storage_error
	 */
	kcenon::common::VoidResult delete_book(
		std::string_view uid, const kcenon::thread::cancellation_token* token = nullptr);

	[[nodiscard]] const service_config& config() const noexcept { return config_; }

	/**
	 * @brief Clamp a caller-supplied pagination window
	 */
	static page_window normalize_window(int64_t skip,
										std::optional<int64_t> limit,
										const service_config& config);

private:
	void log_failure(const std::string& operation, const kcenon::common::error_info& error) const;
	void log_info(const std::string& message) const;

	std::shared_ptr<session::session_manager> sessions_;
	service_config config_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace book_server::service
