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
 * @file error_codes.h
 * @brief Domain error kinds reported by the book service
 *
 * Every failure leaving the store, the session manager or the service is a
 * kcenon::common::error_info whose code is one of the error_kind values
 * below. Callers branch on get_error_kind() rather than on message text.
 *
 * ## Thread Safety
 * All functions are pure and safe to call concurrently.
 *
 * @code
 * using namespace book_server;
 *
 * auto result = service.get_book(uid);
 * if (result.is_err() && get_error_kind(result.error()) == error_kind::not_found) {
 *     // 404-equivalent
 * }
 * @endcode
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <kcenon/common/patterns/result.h>

namespace book_server
{

/**
 * @enum error_kind
 * @brief Failure taxonomy of the book service
 */
enum class error_kind : int
{
	unknown = 0,              ///< Code not produced by book_server
	validation_error = -1001, ///< Malformed or missing input, negative price
	not_found = -1002,        ///< No book with the requested uid
	storage_error = -1003,    ///< Connection, pool or engine failure
};

/**
 * @brief Convert error_kind to string representation
 * @param kind The error kind to convert
 * @return String representation of the error kind
 */
constexpr std::string_view to_string(error_kind kind) noexcept
{
	switch (kind)
	{
	case error_kind::validation_error:
		return "VALIDATION_ERROR";
	case error_kind::not_found:
		return "NOT_FOUND";
	case error_kind::storage_error:
		return "STORAGE_ERROR";
	default:
		return "UNKNOWN";
	}
}

/**
 * @brief Map an error code back to its error_kind
 * @param code error_info::code returned by any book_server component
 * @return Matching kind, or error_kind::unknown for foreign codes
 */
constexpr error_kind get_error_kind(int code) noexcept
{
	switch (code)
	{
	case static_cast<int>(error_kind::validation_error):
		return error_kind::validation_error;
	case static_cast<int>(error_kind::not_found):
		return error_kind::not_found;
	case static_cast<int>(error_kind::storage_error):
		return error_kind::storage_error;
	default:
		return error_kind::unknown;
	}
}

inline error_kind get_error_kind(const kcenon::common::error_info& error) noexcept
{
	return get_error_kind(error.code);
}

/**
 * @brief Build an error_info for the given kind
 * @param kind Error kind
 * @param message Human readable description
 * @param module Reporting component
 */
inline kcenon::common::error_info make_error(error_kind kind,
											 std::string message,
											 std::string module)
{
	return kcenon::common::error_info{ static_cast<int>(kind), std::move(message),
									   std::move(module) };
}

} // namespace book_server
