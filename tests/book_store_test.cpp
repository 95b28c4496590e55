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
 * @file book_store_test.cpp
 * @brief Tests for the SQLite backend and the book store
 *
 * Runs against a temporary database file so that WAL mode, schema
 * constraints and literal escaping are exercised on the real engine.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <kcenon/book_server/core/error_codes.h>
#include <kcenon/book_server/model/uid_generator.h>
#include <kcenon/book_server/storage/book_store.h>
#include <kcenon/book_server/storage/sqlite_backend.h>

using namespace book_server;
using namespace book_server::storage;

namespace
{

std::string temp_database_path()
{
	static std::atomic<int> counter{ 0 };
	auto name = "book_store_test_" + std::to_string(counter++) + "_"
				+ model::generate_book_uid().substr(0, 8) + ".db";
	return (std::filesystem::temp_directory_path() / name).string();
}

void remove_database(const std::string& path)
{
	std::error_code ec;
	std::filesystem::remove(path, ec);
	std::filesystem::remove(path + "-wal", ec);
	std::filesystem::remove(path + "-shm", ec);
}

model::book_fields fields(const std::string& title,
						  const std::string& author,
						  double price,
						  std::optional<std::string> publication = std::nullopt)
{
	model::book_fields f;
	f.title = title;
	f.author = author;
	f.price = price;
	f.publication = std::move(publication);
	return f;
}

} // namespace

// ============================================================================
// Connection URL Tests
// ============================================================================

TEST(SqliteOptionsTest, ParsesRelativeUrl)
{
	auto options = sqlite_options::from_url("sqlite:///books.db");
	ASSERT_TRUE(options.has_value());
	EXPECT_EQ(options->path, "books.db");
	EXPECT_FALSE(options->is_memory());
}

TEST(SqliteOptionsTest, ParsesAbsoluteUrl)
{
	auto options = sqlite_options::from_url("sqlite:////var/lib/books.db");
	ASSERT_TRUE(options.has_value());
	EXPECT_EQ(options->path, "/var/lib/books.db");
}

TEST(SqliteOptionsTest, ParsesMemoryUrls)
{
	EXPECT_TRUE(sqlite_options::from_url("sqlite://")->is_memory());
	EXPECT_TRUE(sqlite_options::from_url(":memory:")->is_memory());
}

TEST(SqliteOptionsTest, AcceptsPlainPath)
{
	auto options = sqlite_options::from_url("/tmp/books.db");
	ASSERT_TRUE(options.has_value());
	EXPECT_EQ(options->path, "/tmp/books.db");
}

TEST(SqliteOptionsTest, RejectsOtherSchemes)
{
	EXPECT_FALSE(sqlite_options::from_url("postgresql://localhost/books").has_value());
	EXPECT_FALSE(sqlite_options::from_url("sqlite://host/books.db").has_value());
	EXPECT_FALSE(sqlite_options::from_url("").has_value());
}

TEST(QuoteLiteralTest, DoublesEmbeddedQuotes)
{
	EXPECT_EQ(quote_literal("plain"), "'plain'");
	EXPECT_EQ(quote_literal("O'Brien"), "'O''Brien'");
	EXPECT_EQ(quote_literal("'); DROP TABLE book; --"), "'''); DROP TABLE book; --'");
}

// ============================================================================
// Sqlite Backend Tests
// ============================================================================

class SqliteBackendTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		path_ = temp_database_path();
		sqlite_options options;
		options.path = path_;
		db_ = std::make_unique<sqlite_backend>(options);
		ASSERT_TRUE(db_->initialize(database::core::connection_config{}).is_ok());
	}

	void TearDown() override
	{
		db_.reset();
		remove_database(path_);
	}

	std::string path_;
	std::unique_ptr<sqlite_backend> db_;
};

TEST_F(SqliteBackendTest, MapsColumnTypes)
{
	auto result = db_->select_query("SELECT 7 AS i, 2.5 AS r, 'text' AS t, NULL AS n");

	ASSERT_TRUE(result.is_ok());
	ASSERT_EQ(result.value().size(), 1u);
	const auto& row = result.value().front();
	EXPECT_EQ(std::get<int64_t>(row.at("i")), 7);
	EXPECT_DOUBLE_EQ(std::get<double>(row.at("r")), 2.5);
	EXPECT_EQ(std::get<std::string>(row.at("t")), "text");
	EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(row.at("n")));
}

TEST_F(SqliteBackendTest, ReportsSyntaxErrors)
{
	auto result = db_->select_query("SELEC nothing");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(get_error_kind(result.error()), error_kind::storage_error);
	EXPECT_FALSE(db_->last_error().empty());
}

TEST_F(SqliteBackendTest, TracksTransactionState)
{
	EXPECT_FALSE(db_->in_transaction());
	ASSERT_TRUE(db_->begin_transaction().is_ok());
	EXPECT_TRUE(db_->in_transaction());
	ASSERT_TRUE(db_->rollback_transaction().is_ok());
	EXPECT_FALSE(db_->in_transaction());
}

TEST_F(SqliteBackendTest, UsesWalJournal)
{
	auto result = db_->select_query("PRAGMA journal_mode");

	ASSERT_TRUE(result.is_ok());
	ASSERT_EQ(result.value().size(), 1u);
	EXPECT_EQ(std::get<std::string>(result.value().front().at("journal_mode")), "wal");
}

TEST_F(SqliteBackendTest, ShutdownClosesHandle)
{
	ASSERT_TRUE(db_->shutdown().is_ok());
	EXPECT_FALSE(db_->is_initialized());
	EXPECT_TRUE(db_->select_query("SELECT 1").is_err());
}

// ============================================================================
// Book Store Tests
// ============================================================================

class BookStoreTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		path_ = temp_database_path();
		sqlite_options options;
		options.path = path_;
		db_ = std::make_unique<sqlite_backend>(options);
		ASSERT_TRUE(db_->initialize(database::core::connection_config{}).is_ok());
		store_ = std::make_unique<book_store>(*db_);
		ASSERT_TRUE(store_->create_schema().is_ok());
	}

	void TearDown() override
	{
		store_.reset();
		db_.reset();
		remove_database(path_);
	}

	std::string path_;
	std::unique_ptr<sqlite_backend> db_;
	std::unique_ptr<book_store> store_;
};

TEST_F(BookStoreTest, CreateSchemaIsIdempotent)
{
	EXPECT_TRUE(store_->create_schema().is_ok());

	auto indexes = db_->select_query(
		"SELECT name FROM sqlite_master WHERE type = 'index' AND tbl_name = 'book' "
		"AND name LIKE 'idx_book_%' ORDER BY name");
	ASSERT_TRUE(indexes.is_ok());
	ASSERT_EQ(indexes.value().size(), 3u);
	EXPECT_EQ(std::get<std::string>(indexes.value()[0].at("name")), "idx_book_author");
	EXPECT_EQ(std::get<std::string>(indexes.value()[1].at("name")), "idx_book_author_title");
	EXPECT_EQ(std::get<std::string>(indexes.value()[2].at("name")), "idx_book_title");
}

TEST_F(BookStoreTest, InsertThenGet)
{
	auto created = store_->insert(fields("The Hobbit", "J.R.R. Tolkien", 12.5, "Allen & Unwin"));

	ASSERT_TRUE(created.is_ok());
	const auto& book = created.value();
	EXPECT_TRUE(model::normalize_uid(book.uid).has_value());
	EXPECT_EQ(book.created_at, book.updated_at);

	auto fetched = store_->get(book.uid);
	ASSERT_TRUE(fetched.is_ok());
	EXPECT_EQ(fetched.value().uid, book.uid);
	EXPECT_EQ(fetched.value().title, "The Hobbit");
	EXPECT_EQ(fetched.value().author, "J.R.R. Tolkien");
	EXPECT_EQ(fetched.value().publication, std::optional<std::string>("Allen & Unwin"));
	EXPECT_DOUBLE_EQ(fetched.value().price, 12.5);
	EXPECT_EQ(fetched.value().created_at, book.created_at);
	EXPECT_EQ(fetched.value().updated_at, book.updated_at);
}

TEST_F(BookStoreTest, PreservesQuotesAndPrecision)
{
	auto created = store_->insert(fields("Don't Panic", "O'Neil", 0.1));
	ASSERT_TRUE(created.is_ok());

	auto fetched = store_->get(created.value().uid);
	ASSERT_TRUE(fetched.is_ok());
	EXPECT_EQ(fetched.value().title, "Don't Panic");
	EXPECT_EQ(fetched.value().author, "O'Neil");
	EXPECT_EQ(fetched.value().price, 0.1);
	EXPECT_FALSE(fetched.value().publication.has_value());
}

TEST_F(BookStoreTest, GetAcceptsUppercaseUid)
{
	auto created = store_->insert(fields("Dune", "Frank Herbert", 9.99));
	ASSERT_TRUE(created.is_ok());

	std::string upper = created.value().uid;
	for (auto& c : upper)
	{
		c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
	}

	auto fetched = store_->get(upper);
	ASSERT_TRUE(fetched.is_ok());
	EXPECT_EQ(fetched.value().uid, created.value().uid);
}

TEST_F(BookStoreTest, GetUnknownOrMalformedUidIsNotFound)
{
	auto unknown = store_->get(model::generate_book_uid());
	ASSERT_TRUE(unknown.is_err());
	EXPECT_EQ(get_error_kind(unknown.error()), error_kind::not_found);

	auto malformed = store_->get("' OR '1'='1");
	ASSERT_TRUE(malformed.is_err());
	EXPECT_EQ(get_error_kind(malformed.error()), error_kind::not_found);
}

TEST_F(BookStoreTest, ListsInCreationOrderWithWindow)
{
	std::vector<std::string> uids;
	for (int i = 0; i < 5; ++i)
	{
		auto created = store_->insert(fields("Book " + std::to_string(i), "Author", 1.0 + i));
		ASSERT_TRUE(created.is_ok());
		uids.push_back(created.value().uid);
	}

	auto all = store_->list(0, 100);
	ASSERT_TRUE(all.is_ok());
	EXPECT_EQ(all.value().total_count, 5u);
	ASSERT_EQ(all.value().books.size(), 5u);
	for (size_t i = 0; i < uids.size(); ++i)
	{
		EXPECT_EQ(all.value().books[i].uid, uids[i]);
	}

	auto window = store_->list(1, 2);
	ASSERT_TRUE(window.is_ok());
	EXPECT_EQ(window.value().total_count, 5u);
	EXPECT_EQ(window.value().skip, 1u);
	EXPECT_EQ(window.value().limit, 2u);
	ASSERT_EQ(window.value().books.size(), 2u);
	EXPECT_EQ(window.value().books[0].uid, uids[1]);
	EXPECT_EQ(window.value().books[1].uid, uids[2]);

	auto beyond = store_->list(10, 2);
	ASSERT_TRUE(beyond.is_ok());
	EXPECT_TRUE(beyond.value().books.empty());
	EXPECT_EQ(beyond.value().total_count, 5u);
}

TEST_F(BookStoreTest, UpdateChangesOnlyPresentFields)
{
	auto created = store_->insert(fields("The Hobbit", "J.R.R. Tolkien", 12.5, "Allen & Unwin"));
	ASSERT_TRUE(created.is_ok());

	model::book_update changes;
	changes.price = 15.0;
	auto updated = store_->update(created.value().uid, changes);

	ASSERT_TRUE(updated.is_ok());
	EXPECT_EQ(updated.value().title, "The Hobbit");
	EXPECT_EQ(updated.value().author, "J.R.R. Tolkien");
	EXPECT_EQ(updated.value().publication, std::optional<std::string>("Allen & Unwin"));
	EXPECT_DOUBLE_EQ(updated.value().price, 15.0);
	EXPECT_EQ(updated.value().created_at, created.value().created_at);
	EXPECT_GT(updated.value().updated_at, created.value().updated_at);
}

TEST_F(BookStoreTest, UpdateAdvancesTimestampOnEveryWrite)
{
	auto created = store_->insert(fields("Dune", "Frank Herbert", 9.99));
	ASSERT_TRUE(created.is_ok());

	auto previous = created.value().updated_at;
	for (int i = 0; i < 5; ++i)
	{
		model::book_update changes;
		changes.price = 10.0 + i;
		auto updated = store_->update(created.value().uid, changes);
		ASSERT_TRUE(updated.is_ok());
		EXPECT_GT(updated.value().updated_at, previous);
		previous = updated.value().updated_at;
	}
}

TEST_F(BookStoreTest, UpdateCanClearPublication)
{
	auto created = store_->insert(fields("Dune", "Frank Herbert", 9.99, "Chilton"));
	ASSERT_TRUE(created.is_ok());

	model::book_update changes;
	changes.publication = std::optional<std::string>(std::nullopt);
	auto updated = store_->update(created.value().uid, changes);

	ASSERT_TRUE(updated.is_ok());
	EXPECT_FALSE(updated.value().publication.has_value());
}

TEST_F(BookStoreTest, EmptyUpdateReturnsCurrentRowWithoutWrite)
{
	auto created = store_->insert(fields("Dune", "Frank Herbert", 9.99));
	ASSERT_TRUE(created.is_ok());

	auto updated = store_->update(created.value().uid, model::book_update{});

	ASSERT_TRUE(updated.is_ok());
	EXPECT_EQ(updated.value().updated_at, created.value().updated_at);
	EXPECT_DOUBLE_EQ(updated.value().price, 9.99);
}

TEST_F(BookStoreTest, UpdateUnknownUidIsNotFoundAndCreatesNothing)
{
	model::book_update changes;
	changes.title = "Ghost";

	auto updated = store_->update(model::generate_book_uid(), changes);

	ASSERT_TRUE(updated.is_err());
	EXPECT_EQ(get_error_kind(updated.error()), error_kind::not_found);
	EXPECT_EQ(store_->count().value(), 0u);
}

TEST_F(BookStoreTest, RemoveThenGetIsNotFound)
{
	auto created = store_->insert(fields("Dune", "Frank Herbert", 9.99));
	ASSERT_TRUE(created.is_ok());

	EXPECT_TRUE(store_->remove(created.value().uid).is_ok());

	auto fetched = store_->get(created.value().uid);
	ASSERT_TRUE(fetched.is_err());
	EXPECT_EQ(get_error_kind(fetched.error()), error_kind::not_found);

	auto again = store_->remove(created.value().uid);
	ASSERT_TRUE(again.is_err());
	EXPECT_EQ(get_error_kind(again.error()), error_kind::not_found);
}

TEST_F(BookStoreTest, SchemaRejectsNegativePrice)
{
	auto result = db_->insert_query(
		"INSERT INTO book (uid, title, author, publication, price, created_at, updated_at) "
		"VALUES ('x', 't', 'a', NULL, -1, 0, 0)");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(store_->count().value(), 0u);
}

TEST_F(BookStoreTest, DuplicateTitleAndAuthorAllowed)
{
	auto first = store_->insert(fields("Dune", "Frank Herbert", 9.99));
	auto second = store_->insert(fields("Dune", "Frank Herbert", 9.99));

	ASSERT_TRUE(first.is_ok());
	ASSERT_TRUE(second.is_ok());
	EXPECT_NE(first.value().uid, second.value().uid);
	EXPECT_EQ(store_->count().value(), 2u);
}
