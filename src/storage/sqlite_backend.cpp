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

#include <kcenon/book_server/storage/sqlite_backend.h>

#include <kcenon/book_server/core/error_codes.h>
#include <kcenon/book_server/logging/console_logger.h>

#include <sqlite3.h>

#include <cstdint>

namespace book_server::storage
{

namespace
{

constexpr const char* module_name = "sqlite_backend";

constexpr std::string_view sqlite_scheme = "sqlite://";

/**
 * @brief Finalizes a prepared statement on scope exit
 */
class statement_guard
{
public:
	explicit statement_guard(sqlite3_stmt* stmt) : stmt_(stmt) {}
	~statement_guard()
	{
		if (stmt_)
		{
			sqlite3_finalize(stmt_);
		}
	}

	statement_guard(const statement_guard&) = delete;
	statement_guard& operator=(const statement_guard&) = delete;

	sqlite3_stmt* get() const { return stmt_; }

private:
	sqlite3_stmt* stmt_;
};

} // namespace

std::optional<sqlite_options> sqlite_options::from_url(std::string_view url)
{
	sqlite_options options;

	if (url.empty())
	{
		return std::nullopt;
	}

	if (url == ":memory:")
	{
		options.path = ":memory:";
		return options;
	}

	if (url.substr(0, sqlite_scheme.size()) == sqlite_scheme)
	{
		auto rest = url.substr(sqlite_scheme.size());
		if (rest.empty() || rest == "/" || rest == "/:memory:")
		{
			options.path = ":memory:";
			return options;
		}
		if (rest.front() != '/')
		{
			// sqlite://host/... names a host, which SQLite has no use for
			return std::nullopt;
		}
		// "sqlite:///x.db" is relative, "sqlite:////x.db" absolute
		options.path = std::string(rest.substr(1));
		return options;
	}

	if (url.find("://") != std::string_view::npos)
	{
		return std::nullopt;
	}

	options.path = std::string(url);
	return options;
}

std::string quote_literal(std::string_view value)
{
	std::string quoted;
	quoted.reserve(value.size() + 2);
	quoted.push_back('\'');
	for (char c : value)
	{
		if (c == '\'')
		{
			quoted.push_back('\'');
		}
		quoted.push_back(c);
	}
	quoted.push_back('\'');
	return quoted;
}

sqlite_backend::sqlite_backend(sqlite_options options,
							   std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: options_(std::move(options))
	, logger_(std::move(logger))
	, db_(nullptr)
{
}

sqlite_backend::~sqlite_backend()
{
	if (db_)
	{
		(void)shutdown();
	}
}

database::database_types sqlite_backend::type() const
{
	return database::database_types::sqlite;
}

kcenon::common::VoidResult sqlite_backend::initialize(
	const database::core::connection_config& /*config*/)
{
	if (db_)
	{
		return kcenon::common::ok();
	}

	const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
	int rc = sqlite3_open_v2(options_.path.c_str(), &db_, flags, nullptr);
	if (rc != SQLITE_OK)
	{
		last_error_ = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
		if (db_)
		{
			sqlite3_close(db_);
			db_ = nullptr;
		}
		return make_error(error_kind::storage_error,
						  "Cannot open database '" + options_.path + "': " + last_error_,
						  module_name);
	}

	sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count()));

	if (options_.enable_wal && !options_.is_memory())
	{
		auto wal = run_script("PRAGMA journal_mode=WAL");
		if (wal.is_err())
		{
			auto error = wal.error();
			sqlite3_close(db_);
			db_ = nullptr;
			return error;
		}
		auto sync = run_script("PRAGMA synchronous=NORMAL");
		if (sync.is_err())
		{
			auto error = sync.error();
			sqlite3_close(db_);
			db_ = nullptr;
			return error;
		}
	}

	return kcenon::common::ok();
}

kcenon::common::VoidResult sqlite_backend::shutdown()
{
	if (!db_)
	{
		return kcenon::common::ok();
	}

	if (sqlite3_get_autocommit(db_) == 0
		&& sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK)
	{
		logging::write_log(logger_, kcenon::common::interfaces::log_level::warning,
						   "Rollback on close failed: " + std::string(sqlite3_errmsg(db_)));
	}

	int rc = sqlite3_close(db_);
	if (rc != SQLITE_OK)
	{
		return engine_error("close");
	}
	db_ = nullptr;
	return kcenon::common::ok();
}

bool sqlite_backend::is_initialized() const
{
	return db_ != nullptr;
}

kcenon::common::Result<uint64_t> sqlite_backend::insert_query(const std::string& query_string)
{
	return run_modification(query_string);
}

kcenon::common::Result<uint64_t> sqlite_backend::update_query(const std::string& query_string)
{
	return run_modification(query_string);
}

kcenon::common::Result<uint64_t> sqlite_backend::delete_query(const std::string& query_string)
{
	return run_modification(query_string);
}

kcenon::common::Result<database::core::database_result> sqlite_backend::select_query(
	const std::string& query_string)
{
	if (!db_)
	{
		return make_error(error_kind::storage_error, "Not initialized", module_name);
	}
	echo(query_string);

	sqlite3_stmt* raw = nullptr;
	int rc = sqlite3_prepare_v2(db_, query_string.c_str(),
								static_cast<int>(query_string.size()), &raw, nullptr);
	statement_guard stmt(raw);
	if (rc != SQLITE_OK || !stmt.get())
	{
		return engine_error("prepare");
	}

	database::core::database_result result;
	const int columns = sqlite3_column_count(stmt.get());

	while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
	{
		database::core::database_row row;
		for (int i = 0; i < columns; ++i)
		{
			const std::string name = sqlite3_column_name(stmt.get(), i);
			switch (sqlite3_column_type(stmt.get(), i))
			{
			case SQLITE_INTEGER:
				row[name] = static_cast<int64_t>(sqlite3_column_int64(stmt.get(), i));
				break;
			case SQLITE_FLOAT:
				row[name] = sqlite3_column_double(stmt.get(), i);
				break;
			case SQLITE_NULL:
				row[name] = nullptr;
				break;
			default:
			{
				const auto* text = sqlite3_column_text(stmt.get(), i);
				const int size = sqlite3_column_bytes(stmt.get(), i);
				row[name] = text ? std::string(reinterpret_cast<const char*>(text),
											   static_cast<size_t>(size))
								 : std::string();
				break;
			}
			}
		}
		result.push_back(std::move(row));
	}

	if (rc != SQLITE_DONE)
	{
		return engine_error("step");
	}
	return result;
}

kcenon::common::VoidResult sqlite_backend::execute_query(const std::string& query_string)
{
	if (!db_)
	{
		return make_error(error_kind::storage_error, "Not initialized", module_name);
	}
	return run_script(query_string);
}

kcenon::common::VoidResult sqlite_backend::begin_transaction()
{
	if (!db_)
	{
		return make_error(error_kind::storage_error, "Not initialized", module_name);
	}
	// IMMEDIATE takes the write lock up front; busy_timeout bounds the wait
	return run_script("BEGIN IMMEDIATE TRANSACTION");
}

kcenon::common::VoidResult sqlite_backend::commit_transaction()
{
	if (!db_)
	{
		return make_error(error_kind::storage_error, "Not initialized", module_name);
	}
	return run_script("COMMIT");
}

kcenon::common::VoidResult sqlite_backend::rollback_transaction()
{
	if (!db_)
	{
		return make_error(error_kind::storage_error, "Not initialized", module_name);
	}
	if (sqlite3_get_autocommit(db_) != 0)
	{
		// A failed COMMIT may already have ended the transaction
		return kcenon::common::ok();
	}
	return run_script("ROLLBACK");
}

bool sqlite_backend::in_transaction() const
{
	return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

std::string sqlite_backend::last_error() const
{
	return last_error_;
}

std::map<std::string, std::string> sqlite_backend::connection_info() const
{
	return {
		{ "type", "sqlite" },
		{ "path", options_.path },
		{ "busy_timeout_ms", std::to_string(options_.busy_timeout.count()) },
		{ "wal", (options_.enable_wal && !options_.is_memory()) ? "true" : "false" },
		{ "library_version", sqlite3_libversion() },
	};
}

kcenon::common::Result<uint64_t> sqlite_backend::run_modification(const std::string& sql)
{
	if (!db_)
	{
		return make_error(error_kind::storage_error, "Not initialized", module_name);
	}
	echo(sql);

	sqlite3_stmt* raw = nullptr;
	int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr);
	statement_guard stmt(raw);
	if (rc != SQLITE_OK || !stmt.get())
	{
		return engine_error("prepare");
	}

	rc = sqlite3_step(stmt.get());
	if (rc != SQLITE_DONE && rc != SQLITE_ROW)
	{
		return engine_error("step");
	}
	return static_cast<uint64_t>(sqlite3_changes(db_));
}

kcenon::common::VoidResult sqlite_backend::run_script(const std::string& sql)
{
	echo(sql);

	char* error_msg = nullptr;
	int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
	if (rc != SQLITE_OK)
	{
		last_error_ = error_msg ? error_msg : sqlite3_errstr(rc);
		sqlite3_free(error_msg);
		return make_error(error_kind::storage_error, last_error_, module_name);
	}
	return kcenon::common::ok();
}

kcenon::common::error_info sqlite_backend::engine_error(const std::string& context)
{
	last_error_ = sqlite3_errmsg(db_);
	return make_error(error_kind::storage_error, context + " failed: " + last_error_,
					  module_name);
}

void sqlite_backend::echo(const std::string& sql) const
{
	if (options_.echo)
	{
		logging::write_log(logger_, kcenon::common::interfaces::log_level::info, "SQL: " + sql);
	}
}

} // namespace book_server::storage
