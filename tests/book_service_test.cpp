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
 * @file book_service_test.cpp
 * @brief End-to-end tests of the book service over a pooled SQLite database
 *
 * Tests cover:
 * - Create, get, list, update and delete scenarios
 * - Validation before storage
 * - Pagination normalization
 * - Concurrent creates and conflicting concurrent updates
 * - Application wiring, in-memory databases and shutdown
 */

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <kcenon/book_server/core/error_codes.h>
#include <kcenon/book_server/model/uid_generator.h>
#include <kcenon/book_server/pooling/connection_pool.h>
#include <kcenon/book_server/server_app.h>
#include <kcenon/book_server/service/book_service.h>

using namespace book_server;
using namespace book_server::model;
using book_server::service::book_service;
using book_server::service::service_config;

namespace
{

book_create make_request(std::optional<std::string> title,
						 std::optional<std::string> author,
						 std::optional<double> price,
						 std::optional<std::string> publication = std::nullopt)
{
	book_create request;
	request.title = std::move(title);
	request.author = std::move(author);
	request.price = price;
	request.publication = std::move(publication);
	return request;
}

} // namespace

// ============================================================================
// Book Service Test Fixture
// ============================================================================

class BookServiceTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		path_ = (std::filesystem::temp_directory_path()
				 / ("book_service_test_" + generate_book_uid().substr(0, 8) + ".db"))
					.string();

		auto config = server_config::default_config();
		config.database.url = "sqlite:///" + path_;
		config.database.pool_size = 4;
		config.database.max_overflow = 4;
		config.database.acquire_timeout_ms = 10000;
		config.logging.level = "debug";

		app_ = std::make_unique<server_app>(&log_);
		auto init = app_->initialize(config);
		ASSERT_TRUE(init.is_ok()) << init.error().message;
	}

	void TearDown() override
	{
		app_.reset();
		std::error_code ec;
		std::filesystem::remove(path_, ec);
		std::filesystem::remove(path_ + "-wal", ec);
		std::filesystem::remove(path_ + "-shm", ec);
	}

	book_service& books() { return app_->books(); }

	std::string path_;
	std::ostringstream log_;
	std::unique_ptr<server_app> app_;
};

// ============================================================================
// Scenario Tests
// ============================================================================

TEST_F(BookServiceTest, CreateReturnsGeneratedMetadata)
{
	auto created = books().create_book(
		make_request("The Alchemist", "Paulo Coelho", 399.99, "HarperCollins"));

	ASSERT_TRUE(created.is_ok());
	const auto& book = created.value();
	EXPECT_TRUE(normalize_uid(book.uid).has_value());
	EXPECT_EQ(book.title, "The Alchemist");
	EXPECT_EQ(book.author, "Paulo Coelho");
	EXPECT_EQ(book.publication, std::optional<std::string>("HarperCollins"));
	EXPECT_DOUBLE_EQ(book.price, 399.99);
	EXPECT_EQ(book.created_at, book.updated_at);

	auto fetched = books().get_book(book.uid);
	ASSERT_TRUE(fetched.is_ok());
	EXPECT_EQ(fetched.value().title, book.title);
	EXPECT_EQ(fetched.value().created_at, book.created_at);
}

TEST_F(BookServiceTest, UpdatePriceKeepsOtherFields)
{
	auto created = books().create_book(
		make_request("The Alchemist", "Paulo Coelho", 399.99, "HarperCollins"));
	ASSERT_TRUE(created.is_ok());

	book_update changes;
	changes.price = 449.99;
	auto updated = books().update_book(created.value().uid, changes);

	ASSERT_TRUE(updated.is_ok());
	EXPECT_EQ(updated.value().title, "The Alchemist");
	EXPECT_EQ(updated.value().author, "Paulo Coelho");
	EXPECT_EQ(updated.value().publication, std::optional<std::string>("HarperCollins"));
	EXPECT_DOUBLE_EQ(updated.value().price, 449.99);
	EXPECT_EQ(updated.value().created_at, created.value().created_at);
	EXPECT_GT(updated.value().updated_at, created.value().updated_at);
}

TEST_F(BookServiceTest, ListReturnsCreationOrder)
{
	std::vector<std::string> uids;
	for (const char* title : { "A", "B", "C" })
	{
		auto created = books().create_book(make_request(title, "Author", 10.0));
		ASSERT_TRUE(created.is_ok());
		uids.push_back(created.value().uid);
	}

	auto page = books().list_books(0, 10);

	ASSERT_TRUE(page.is_ok());
	EXPECT_EQ(page.value().total_count, 3u);
	ASSERT_EQ(page.value().books.size(), 3u);
	EXPECT_EQ(page.value().books[0].uid, uids[0]);
	EXPECT_EQ(page.value().books[1].uid, uids[1]);
	EXPECT_EQ(page.value().books[2].uid, uids[2]);

	auto again = books().list_books(0, 10);
	ASSERT_TRUE(again.is_ok());
	ASSERT_EQ(again.value().books.size(), 3u);
	for (size_t i = 0; i < 3; ++i)
	{
		EXPECT_EQ(again.value().books[i].uid, page.value().books[i].uid);
	}
}

TEST_F(BookServiceTest, DeleteThenGetIsNotFound)
{
	auto created = books().create_book(make_request("Dune", "Frank Herbert", 9.99));
	ASSERT_TRUE(created.is_ok());

	ASSERT_TRUE(books().delete_book(created.value().uid).is_ok());

	auto fetched = books().get_book(created.value().uid);
	ASSERT_TRUE(fetched.is_err());
	EXPECT_EQ(get_error_kind(fetched.error()), error_kind::not_found);
	EXPECT_NE(log_.str().find("Failed to get book"), std::string::npos);
}

TEST_F(BookServiceTest, CreateWithoutTitleIsRejectedBeforeStorage)
{
	auto created = books().create_book(make_request(std::nullopt, "X", 10.0));

	ASSERT_TRUE(created.is_err());
	EXPECT_EQ(get_error_kind(created.error()), error_kind::validation_error);

	auto page = books().list_books(0);
	ASSERT_TRUE(page.is_ok());
	EXPECT_EQ(page.value().total_count, 0u);
}

// ============================================================================
// Validation And Error Propagation Tests
// ============================================================================

TEST_F(BookServiceTest, EmbeddedNulIsValidationError)
{
	auto created = books().create_book(
		make_request(std::string("Du\0ne", 5), "Frank Herbert", 9.99));

	ASSERT_TRUE(created.is_err());
	EXPECT_EQ(get_error_kind(created.error()), error_kind::validation_error);
	EXPECT_EQ(books().list_books(0).value().total_count, 0u);
}

TEST_F(BookServiceTest, NonAsciiTitleRoundTrips)
{
	std::string title;
	for (int i = 0; i < 150; ++i)
	{
		title += "\xD0\x96";
	}

	auto created = books().create_book(make_request(title, "Author", 1.0));
	ASSERT_TRUE(created.is_ok()) << created.error().message;

	auto fetched = books().get_book(created.value().uid);
	ASSERT_TRUE(fetched.is_ok());
	EXPECT_EQ(fetched.value().title, title);
}

TEST_F(BookServiceTest, NegativePriceIsValidationError)
{
	auto created = books().create_book(make_request("Dune", "Frank Herbert", -1.0));

	ASSERT_TRUE(created.is_err());
	EXPECT_EQ(get_error_kind(created.error()), error_kind::validation_error);
}

TEST_F(BookServiceTest, InvalidUpdateLeavesRowUntouched)
{
	auto created = books().create_book(make_request("Dune", "Frank Herbert", 9.99));
	ASSERT_TRUE(created.is_ok());

	book_update changes;
	changes.title = "Dune Messiah";
	changes.price = -5.0;
	auto updated = books().update_book(created.value().uid, changes);

	ASSERT_TRUE(updated.is_err());
	EXPECT_EQ(get_error_kind(updated.error()), error_kind::validation_error);

	auto fetched = books().get_book(created.value().uid);
	ASSERT_TRUE(fetched.is_ok());
	EXPECT_EQ(fetched.value().title, "Dune");
	EXPECT_EQ(fetched.value().updated_at, created.value().updated_at);
}

TEST_F(BookServiceTest, UpdateUnknownUidIsNotFound)
{
	book_update changes;
	changes.price = 1.0;

	auto updated = books().update_book(generate_book_uid(), changes);

	ASSERT_TRUE(updated.is_err());
	EXPECT_EQ(get_error_kind(updated.error()), error_kind::not_found);
	EXPECT_EQ(books().list_books(0).value().total_count, 0u);
}

TEST_F(BookServiceTest, EmptyUpdateReturnsCurrentBook)
{
	auto created = books().create_book(make_request("Dune", "Frank Herbert", 9.99));
	ASSERT_TRUE(created.is_ok());

	auto updated = books().update_book(created.value().uid, book_update{});

	ASSERT_TRUE(updated.is_ok());
	EXPECT_EQ(updated.value().updated_at, created.value().updated_at);
}

TEST_F(BookServiceTest, DeleteUnknownUidIsNotFound)
{
	auto deleted = books().delete_book(generate_book_uid());

	ASSERT_TRUE(deleted.is_err());
	EXPECT_EQ(get_error_kind(deleted.error()), error_kind::not_found);
}

TEST_F(BookServiceTest, CancelledCallIsStorageError)
{
	auto token = kcenon::thread::cancellation_token::create();
	token.cancel();

	auto created = books().create_book(make_request("Dune", "Frank Herbert", 9.99), &token);

	ASSERT_TRUE(created.is_err());
	EXPECT_EQ(get_error_kind(created.error()), error_kind::storage_error);
	EXPECT_EQ(books().list_books(0).value().total_count, 0u);
}

// ============================================================================
// Pagination Tests
// ============================================================================

TEST(PaginationTest, NormalizesWindow)
{
	service_config config;

	auto defaults = book_service::normalize_window(0, std::nullopt, config);
	EXPECT_EQ(defaults.skip, 0u);
	EXPECT_EQ(defaults.limit, 100u);

	auto negative = book_service::normalize_window(-5, -3, config);
	EXPECT_EQ(negative.skip, 0u);
	EXPECT_EQ(negative.limit, 1u);

	auto large = book_service::normalize_window(20, 5000, config);
	EXPECT_EQ(large.skip, 20u);
	EXPECT_EQ(large.limit, 1000u);

	auto exact = book_service::normalize_window(3, 7, config);
	EXPECT_EQ(exact.skip, 3u);
	EXPECT_EQ(exact.limit, 7u);
}

TEST_F(BookServiceTest, ListNeverExceedsLimit)
{
	for (int i = 0; i < 7; ++i)
	{
		ASSERT_TRUE(books().create_book(make_request("Book " + std::to_string(i), "A", 1.0)).is_ok());
	}

	auto first = books().list_books(0, 3);
	auto second = books().list_books(3, 3);
	auto third = books().list_books(6, 3);

	ASSERT_TRUE(first.is_ok());
	ASSERT_TRUE(second.is_ok());
	ASSERT_TRUE(third.is_ok());
	EXPECT_EQ(first.value().books.size(), 3u);
	EXPECT_EQ(second.value().books.size(), 3u);
	EXPECT_EQ(third.value().books.size(), 1u);
	EXPECT_EQ(first.value().books[0].title, "Book 0");
	EXPECT_EQ(second.value().books[0].title, "Book 3");
	EXPECT_EQ(third.value().books[0].title, "Book 6");
	EXPECT_EQ(third.value().total_count, 7u);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST_F(BookServiceTest, ConcurrentCreatesProduceUniqueRows)
{
	constexpr int thread_count = 8;
	constexpr int per_thread = 20;

	std::mutex uids_mutex;
	std::set<std::string> uids;
	std::atomic<int> failures{ 0 };
	std::vector<std::thread> threads;

	for (int t = 0; t < thread_count; ++t)
	{
		threads.emplace_back(
			[&, t]()
			{
				for (int i = 0; i < per_thread; ++i)
				{
					auto created = books().create_book(make_request(
						"T" + std::to_string(t) + "-" + std::to_string(i), "Author", 1.0));
					if (created.is_err())
					{
						failures++;
						continue;
					}
					std::lock_guard<std::mutex> lock(uids_mutex);
					uids.insert(created.value().uid);
				}
			});
	}

	for (auto& thread : threads)
	{
		thread.join();
	}

	EXPECT_EQ(failures.load(), 0);
	EXPECT_EQ(uids.size(), static_cast<size_t>(thread_count * per_thread));
	EXPECT_EQ(books().list_books(0, 1000).value().total_count,
			  static_cast<uint64_t>(thread_count * per_thread));
	EXPECT_EQ(app_->pool().active_connections(), 0u);
}

TEST_F(BookServiceTest, ConcurrentUpdatesNeverInterleave)
{
	auto created = books().create_book(make_request("start", "start", 1.0));
	ASSERT_TRUE(created.is_ok());
	const auto uid = created.value().uid;

	constexpr int iterations = 50;
	std::atomic<int> failures{ 0 };

	auto writer = [&](const std::string& value, double price)
	{
		for (int i = 0; i < iterations; ++i)
		{
			book_update changes;
			changes.title = value;
			changes.author = value;
			changes.price = price;
			if (books().update_book(uid, changes).is_err())
			{
				failures++;
			}
		}
	};

	std::thread first(writer, "first", 10.0);
	std::thread second(writer, "second", 20.0);
	first.join();
	second.join();

	EXPECT_EQ(failures.load(), 0);

	auto final_state = books().get_book(uid);
	ASSERT_TRUE(final_state.is_ok());
	const auto& book = final_state.value();
	EXPECT_EQ(book.title, book.author);
	if (book.title == "first")
	{
		EXPECT_DOUBLE_EQ(book.price, 10.0);
	}
	else
	{
		EXPECT_EQ(book.title, "second");
		EXPECT_DOUBLE_EQ(book.price, 20.0);
	}
	EXPECT_GT(book.updated_at, created.value().updated_at);
}

// ============================================================================
// Application Wiring Tests
// ============================================================================

TEST(ServerAppTest, InMemoryDatabaseUsesSingleConnection)
{
	auto config = server_config::default_config();
	config.database.url = "sqlite://";

	std::ostringstream log;
	server_app app(&log);
	auto init = app.initialize(config);

	ASSERT_TRUE(init.is_ok()) << init.error().message;
	EXPECT_EQ(app.state(), server_state::initialized);
	EXPECT_EQ(app.pool().config().pool_size, 1u);
	EXPECT_EQ(app.pool().config().max_overflow, 0u);
	EXPECT_NE(log.str().find("In-memory database"), std::string::npos);

	auto created = app.books().create_book(make_request("Dune", "Frank Herbert", 9.99));
	ASSERT_TRUE(created.is_ok());
	EXPECT_TRUE(app.books().get_book(created.value().uid).is_ok());

	app.shutdown();
	EXPECT_EQ(app.state(), server_state::stopped);
}

TEST(ServerAppTest, RejectsInvalidConfiguration)
{
	auto config = server_config::default_config();
	config.database.pool_size = 0;

	std::ostringstream log;
	server_app app(&log);
	auto init = app.initialize(config);

	ASSERT_TRUE(init.is_err());
	EXPECT_EQ(app.state(), server_state::uninitialized);
}

TEST(ServerAppTest, RejectsUnsupportedUrl)
{
	auto config = server_config::default_config();
	config.database.url = "postgresql://localhost/books";

	std::ostringstream log;
	server_app app(&log);
	auto init = app.initialize(config);

	ASSERT_TRUE(init.is_err());
	EXPECT_NE(init.error().message.find("Unsupported database URL"), std::string::npos);
}

TEST(ServerAppTest, EchoLogsStatements)
{
	auto config = server_config::default_config();
	config.database.url = ":memory:";
	config.database.echo = true;

	std::ostringstream log;
	server_app app(&log);
	ASSERT_TRUE(app.initialize(config).is_ok());

	EXPECT_NE(log.str().find("SQL: CREATE TABLE IF NOT EXISTS book"), std::string::npos);
}

TEST(ServerAppTest, CallsAfterShutdownFailWithStorageError)
{
	auto config = server_config::default_config();
	config.database.url = ":memory:";

	std::ostringstream log;
	server_app app(&log);
	ASSERT_TRUE(app.initialize(config).is_ok());

	app.shutdown();

	auto result = app.books().list_books(0);
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(get_error_kind(result.error()), error_kind::storage_error);
}
