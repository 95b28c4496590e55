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
 * @file book_store.h
 * @brief Persistence of book records over a database backend
 *
 * The store translates book operations into SQL against the `book` table of
 * a single connection. It neither opens connections nor manages
 * transactions: callers run it inside a unit of work provided by
 * session::session_manager.
 *
 * Error mapping:
 * - malformed or unknown uid -> error_kind::not_found
 * - any backend failure -> error_kind::storage_error
 *
 * @code
 * book_server::storage::book_store store(*conn);
 * auto created = store.insert(fields);
 * auto page = store.list(0, 100);
 * @endcode
 */

#pragma once

#include <kcenon/book_server/model/book.h>

#include <database/core/database_backend.h>

#include <kcenon/common/patterns/result.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace book_server::storage
{

/**
 * @class book_store
 * @brief CRUD access to the book table through one connection
 *
 * Not thread-safe; bound to the connection of the current unit of work.
 */
class book_store
{
public:
	explicit book_store(database::core::database_backend& db);

	/**
	 * @brief Create the book table and its indexes if they do not exist
	 */
	kcenon::common::VoidResult create_schema();

	/**
	 * @brief Persist a new book
	 * @param fields Validated creation payload
	 * @return Stored record with generated uid and timestamps
	 */
	kcenon::common::Result<model::book> insert(const model::book_fields& fields);

	/**
	 * @brief Fetch a book by uid
	 * @param uid Canonical or upper-case UUID text
	 */
	kcenon::common::Result<model::book> get(std::string_view uid);

	/**
	 * @brief Fetch one window of books in creation order
	 * @param skip Records to skip
	 * @param limit Maximum records to return
	 * @return Page with the total table count
	 */
	kcenon::common::Result<model::book_page> list(uint64_t skip, uint64_t limit);

	/**
	 * @brief Apply a validated partial update
	 *
	 * An empty update returns the current record without writing.
	 * Otherwise updated_at advances strictly past its previous value.
	 */
	kcenon::common::Result<model::book> update(std::string_view uid,
											   const model::book_update& changes);

	kcenon::common::VoidResult remove(std::string_view uid);

	/// Number of rows in the book table
	kcenon::common::Result<uint64_t> count();

private:
	database::core::database_backend& db_;
};

} // namespace book_server::storage
