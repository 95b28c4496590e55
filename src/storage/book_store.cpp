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

#include <kcenon/book_server/storage/book_store.h>

#include <kcenon/book_server/core/error_codes.h>
#include <kcenon/book_server/model/uid_generator.h>
#include <kcenon/book_server/storage/sqlite_backend.h>

#include <array>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <type_traits>
#include <variant>

namespace book_server::storage
{

namespace
{

constexpr const char* module_name = "book_store";

constexpr const char* book_columns
	= "uid, title, author, publication, price, created_at, updated_at";

// Executed one statement at a time; IF NOT EXISTS keeps them idempotent
constexpr std::array<const char*, 4> schema_statements = {
	"CREATE TABLE IF NOT EXISTS book ("
	" uid TEXT PRIMARY KEY NOT NULL,"
	" title TEXT NOT NULL CHECK (length(title) BETWEEN 1 AND 200),"
	" author TEXT NOT NULL CHECK (length(author) BETWEEN 1 AND 100),"
	" publication TEXT CHECK (publication IS NULL OR length(publication) <= 100),"
	" price REAL NOT NULL CHECK (price >= 0),"
	" created_at INTEGER NOT NULL,"
	" updated_at INTEGER NOT NULL CHECK (updated_at >= created_at)"
	")",
	"CREATE INDEX IF NOT EXISTS idx_book_title ON book (title)",
	"CREATE INDEX IF NOT EXISTS idx_book_author ON book (author)",
	"CREATE INDEX IF NOT EXISTS idx_book_author_title ON book (author, title)",
};

kcenon::common::error_info storage_failure(const std::string& action,
										   const kcenon::common::error_info& cause)
{
	return make_error(error_kind::storage_error, action + ": " + cause.message, module_name);
}

kcenon::common::error_info book_not_found(std::string_view uid)
{
	return make_error(error_kind::not_found, "Book with uid '" + std::string(uid) + "' not found",
					  module_name);
}

std::string price_literal(double price)
{
	std::ostringstream oss;
	oss.imbue(std::locale::classic());
	oss << std::setprecision(std::numeric_limits<double>::max_digits10) << price;
	return oss.str();
}

std::string optional_literal(const std::optional<std::string>& value)
{
	return value ? quote_literal(*value) : std::string("NULL");
}

std::optional<std::string> text_column(const database::core::database_row& row,
									   const std::string& name)
{
	auto cell = row.find(name);
	if (cell == row.end())
	{
		return std::nullopt;
	}
	return std::visit(
		[](const auto& val) -> std::optional<std::string>
		{
			using T = std::decay_t<decltype(val)>;
			if constexpr (std::is_same_v<T, std::string>)
				return val;
			else
				return std::nullopt;
		},
		cell->second);
}

std::optional<int64_t> integer_column(const database::core::database_row& row,
									  const std::string& name)
{
	auto cell = row.find(name);
	if (cell == row.end())
	{
		return std::nullopt;
	}
	return std::visit(
		[](const auto& val) -> std::optional<int64_t>
		{
			using T = std::decay_t<decltype(val)>;
			if constexpr (std::is_same_v<T, bool>)
				return std::nullopt;
			else if constexpr (std::is_integral_v<T>)
				return static_cast<int64_t>(val);
			else
				return std::nullopt;
		},
		cell->second);
}

std::optional<double> real_column(const database::core::database_row& row,
								  const std::string& name)
{
	auto cell = row.find(name);
	if (cell == row.end())
	{
		return std::nullopt;
	}
	return std::visit(
		[](const auto& val) -> std::optional<double>
		{
			using T = std::decay_t<decltype(val)>;
			if constexpr (std::is_same_v<T, bool>)
				return std::nullopt;
			else if constexpr (std::is_arithmetic_v<T>)
				return static_cast<double>(val);
			else
				return std::nullopt;
		},
		cell->second);
}

kcenon::common::Result<model::book> to_book(const database::core::database_row& row)
{
	auto uid = text_column(row, "uid");
	auto title = text_column(row, "title");
	auto author = text_column(row, "author");
	auto price = real_column(row, "price");
	auto created_at = integer_column(row, "created_at");
	auto updated_at = integer_column(row, "updated_at");

	if (!uid || !title || !author || !price || !created_at || !updated_at)
	{
		return make_error(error_kind::storage_error, "Malformed book row", module_name);
	}

	model::book result;
	result.uid = std::move(*uid);
	result.title = std::move(*title);
	result.author = std::move(*author);
	result.publication = text_column(row, "publication");
	result.price = *price;
	result.created_at = model::from_microseconds(*created_at);
	result.updated_at = model::from_microseconds(*updated_at);
	return result;
}

} // namespace

book_store::book_store(database::core::database_backend& db) : db_(db) {}

kcenon::common::VoidResult book_store::create_schema()
{
	for (const char* statement : schema_statements)
	{
		auto result = db_.execute_query(statement);
		if (result.is_err())
		{
			return storage_failure("Failed to create schema", result.error());
		}
	}
	return kcenon::common::ok();
}

kcenon::common::Result<model::book> book_store::insert(const model::book_fields& fields)
{
	model::book record;
	record.uid = model::generate_book_uid();
	record.title = fields.title;
	record.author = fields.author;
	record.publication = fields.publication;
	record.price = fields.price;
	record.created_at = model::now();
	record.updated_at = record.created_at;

	const auto stamp = std::to_string(model::to_microseconds(record.created_at));
	std::string sql = "INSERT INTO book (" + std::string(book_columns) + ") VALUES ("
					  + quote_literal(record.uid) + ", " + quote_literal(record.title) + ", "
					  + quote_literal(record.author) + ", "
					  + optional_literal(record.publication) + ", "
					  + price_literal(record.price) + ", " + stamp + ", " + stamp + ")";

	auto inserted = db_.insert_query(sql);
	if (inserted.is_err())
	{
		return storage_failure("Failed to insert book", inserted.error());
	}
	if (inserted.value() != 1)
	{
		return make_error(error_kind::storage_error, "Insert affected no rows", module_name);
	}
	return record;
}

kcenon::common::Result<model::book> book_store::get(std::string_view uid)
{
	auto canonical = model::normalize_uid(uid);
	if (!canonical)
	{
		return book_not_found(uid);
	}

	auto rows = db_.select_query("SELECT " + std::string(book_columns)
								 + " FROM book WHERE uid = " + quote_literal(*canonical));
	if (rows.is_err())
	{
		return storage_failure("Failed to read book", rows.error());
	}
	if (rows.value().empty())
	{
		return book_not_found(uid);
	}
	return to_book(rows.value().front());
}

kcenon::common::Result<uint64_t> book_store::count()
{
	auto rows = db_.select_query("SELECT COUNT(*) AS total FROM book");
	if (rows.is_err())
	{
		return storage_failure("Failed to count books", rows.error());
	}
	if (rows.value().empty())
	{
		return make_error(error_kind::storage_error, "COUNT returned no row", module_name);
	}
	auto total = integer_column(rows.value().front(), "total");
	if (!total || *total < 0)
	{
		return make_error(error_kind::storage_error, "Malformed COUNT result", module_name);
	}
	return static_cast<uint64_t>(*total);
}

kcenon::common::Result<model::book_page> book_store::list(uint64_t skip, uint64_t limit)
{
	model::book_page page;
	page.skip = skip;
	page.limit = limit;

	auto total = count();
	if (total.is_err())
	{
		return total.error();
	}
	page.total_count = total.value();

	if (limit == 0 || skip >= page.total_count)
	{
		return page;
	}

	// rowid breaks ties between books created in the same microsecond
	auto rows = db_.select_query("SELECT " + std::string(book_columns)
								 + " FROM book ORDER BY created_at ASC, rowid ASC LIMIT "
								 + std::to_string(limit) + " OFFSET " + std::to_string(skip));
	if (rows.is_err())
	{
		return storage_failure("Failed to list books", rows.error());
	}

	page.books.reserve(rows.value().size());
	for (const auto& row : rows.value())
	{
		auto record = to_book(row);
		if (record.is_err())
		{
			return record.error();
		}
		page.books.push_back(std::move(record.value()));
	}
	return page;
}

kcenon::common::Result<model::book> book_store::update(std::string_view uid,
													   const model::book_update& changes)
{
	if (changes.empty())
	{
		return get(uid);
	}

	auto canonical = model::normalize_uid(uid);
	if (!canonical)
	{
		return book_not_found(uid);
	}

	std::string assignments;
	auto assign = [&assignments](const char* column, const std::string& literal)
	{
		assignments += column;
		assignments += " = ";
		assignments += literal;
		assignments += ", ";
	};

	if (changes.title)
		assign("title", quote_literal(*changes.title));
	if (changes.author)
		assign("author", quote_literal(*changes.author));
	if (changes.publication)
		assign("publication", optional_literal(*changes.publication));
	if (changes.price)
		assign("price", price_literal(*changes.price));

	// updated_at must strictly advance even if the clock did not
	const auto stamp = std::to_string(model::to_microseconds(model::now()));
	assignments += "updated_at = MAX(" + stamp + ", updated_at + 1)";

	auto updated = db_.update_query("UPDATE book SET " + assignments
									+ " WHERE uid = " + quote_literal(*canonical));
	if (updated.is_err())
	{
		return storage_failure("Failed to update book", updated.error());
	}
	if (updated.value() == 0)
	{
		return book_not_found(uid);
	}
	return get(*canonical);
}

kcenon::common::VoidResult book_store::remove(std::string_view uid)
{
	auto canonical = model::normalize_uid(uid);
	if (!canonical)
	{
		return book_not_found(uid);
	}

	auto deleted = db_.delete_query("DELETE FROM book WHERE uid = " + quote_literal(*canonical));
	if (deleted.is_err())
	{
		return storage_failure("Failed to delete book", deleted.error());
	}
	if (deleted.value() == 0)
	{
		return book_not_found(uid);
	}
	return kcenon::common::ok();
}

} // namespace book_server::storage
