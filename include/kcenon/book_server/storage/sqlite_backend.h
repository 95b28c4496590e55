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
 * @file sqlite_backend.h
 * @brief SQLite implementation of database::core::database_backend
 *
 * One instance owns one sqlite3 handle and is used by one thread at a time;
 * the connection pool provides that exclusivity. Transactions are opened
 * with BEGIN IMMEDIATE so that concurrent writers on the same file are
 * serialized by the engine and the last committed write wins.
 *
 * Column values are mapped to the database_row variant as follows:
 * INTEGER -> int64_t, REAL -> double, TEXT and BLOB -> std::string,
 * NULL -> nullptr.
 */

#pragma once

#include <database/core/database_backend.h>
#include <database/database_types.h>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;

namespace book_server::storage
{

/**
 * @struct sqlite_options
 * @brief How a single SQLite connection is opened
 */
struct sqlite_options
{
	std::string path = "books.db";                  ///< File path or ":memory:"
	std::chrono::milliseconds busy_timeout{ 5000 }; ///< Wait for locks held by other connections
	bool echo = false;                              ///< Log every statement at info level
	bool enable_wal = true;                         ///< journal_mode=WAL for file databases

	/**
	 * @brief Check whether the options address a private in-memory database
	 */
	[[nodiscard]] bool is_memory() const noexcept { return path == ":memory:"; }

	/**
	 * @brief Parse a connection URL
	 *
	 * Accepted forms:
	 * - "sqlite:///relative.db" and "sqlite:////absolute/path.db"
	 * - "sqlite://" and ":memory:" for an in-memory database
	 * - a plain file path
	 *
	 * @param url Connection URL
	 * @return Options with only path set, or std::nullopt for other schemes
	 */
	static std::optional<sqlite_options> from_url(std::string_view url);
};

/**
 * @class sqlite_backend
 * @brief database_backend over the SQLite C API
 */
class sqlite_backend : public database::core::database_backend
{
public:
	explicit sqlite_backend(sqlite_options options,
							std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	~sqlite_backend() override;

	sqlite_backend(const sqlite_backend&) = delete;
	sqlite_backend& operator=(const sqlite_backend&) = delete;

	database::database_types type() const override;

	/**
	 * @brief Open the database file and apply connection pragmas
	 *
	 * The connection_config argument is ignored; the location comes from
	 * the sqlite_options given at construction.
	 */
	kcenon::common::VoidResult initialize(const database::core::connection_config& config) override;

	kcenon::common::VoidResult shutdown() override;

	bool is_initialized() const override;

	/// @return Number of rows inserted
	kcenon::common::Result<uint64_t> insert_query(const std::string& query_string) override;

	/// @return Number of rows changed
	kcenon::common::Result<uint64_t> update_query(const std::string& query_string) override;

	/// @return Number of rows deleted
	kcenon::common::Result<uint64_t> delete_query(const std::string& query_string) override;

	kcenon::common::Result<database::core::database_result> select_query(
		const std::string& query_string) override;

	/**
	 * @brief Run one or more statements that produce no rows
	 */
	kcenon::common::VoidResult execute_query(const std::string& query_string) override;

	kcenon::common::VoidResult begin_transaction() override;
	kcenon::common::VoidResult commit_transaction() override;
	kcenon::common::VoidResult rollback_transaction() override;

	bool in_transaction() const override;

	std::string last_error() const override;

	std::map<std::string, std::string> connection_info() const override;

	[[nodiscard]] const sqlite_options& options() const noexcept { return options_; }

private:
	kcenon::common::Result<uint64_t> run_modification(const std::string& sql);
	kcenon::common::VoidResult run_script(const std::string& sql);
	kcenon::common::error_info engine_error(const std::string& context);
	void echo(const std::string& sql) const;

	sqlite_options options_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	sqlite3* db_;
	std::string last_error_;
};

/**
 * @brief Quote a value as an SQL string literal
 * @param value Raw text
 * @return Text wrapped in single quotes with embedded quotes doubled
 */
[[nodiscard]] std::string quote_literal(std::string_view value);

} // namespace book_server::storage
