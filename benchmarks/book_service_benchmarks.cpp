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
 * @file book_service_benchmarks.cpp
 * @brief Performance benchmarks for the book service stack
 *
 * Benchmarks cover:
 * - Payload validation and uid generation
 * - Pool acquire/release overhead
 * - Create, get and list round trips through the session manager
 */

#include <benchmark/benchmark.h>

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <kcenon/book_server/model/book.h>
#include <kcenon/book_server/model/uid_generator.h>
#include <kcenon/book_server/server_app.h>

using namespace book_server;
using namespace book_server::model;

// ============================================================================
// Benchmark Fixtures
// ============================================================================

class BookServiceBenchmarkFixture : public benchmark::Fixture
{
public:
	void SetUp(const benchmark::State& /*state*/) override
	{
		path_ = (std::filesystem::temp_directory_path()
				 / ("book_bench_" + generate_book_uid().substr(0, 8) + ".db"))
					.string();

		auto config = server_config::default_config();
		config.database.url = "sqlite:///" + path_;
		config.database.pool_size = 4;
		config.logging.level = "error";

		app_ = std::make_unique<server_app>(&log_);
		ready_ = app_->initialize(config).is_ok();
	}

	void TearDown(const benchmark::State& /*state*/) override
	{
		app_.reset();
		std::error_code ec;
		std::filesystem::remove(path_, ec);
		std::filesystem::remove(path_ + "-wal", ec);
		std::filesystem::remove(path_ + "-shm", ec);
	}

protected:
	book_create create_request()
	{
		book_create request;
		request.title = "Benchmark Book " + std::to_string(counter_++);
		request.author = "Benchmark Author";
		request.publication = "Benchmark Press";
		request.price = 19.99;
		return request;
	}

	std::vector<std::string> seed(size_t count)
	{
		std::vector<std::string> uids;
		uids.reserve(count);
		for (size_t i = 0; i < count; ++i)
		{
			auto created = app_->books().create_book(create_request());
			if (created.is_ok())
			{
				uids.push_back(created.value().uid);
			}
		}
		return uids;
	}

	std::string path_;
	std::ostringstream log_;
	std::unique_ptr<server_app> app_;
	bool ready_ = false;
	uint64_t counter_ = 0;
};

// ============================================================================
// Model Benchmarks
// ============================================================================

static void BM_GenerateUid(benchmark::State& state)
{
	for (auto _ : state)
	{
		auto uid = generate_book_uid();
		benchmark::DoNotOptimize(uid);
	}
	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GenerateUid)->Unit(benchmark::kNanosecond);

static void BM_ValidateCreate(benchmark::State& state)
{
	book_create request;
	request.title = "  The Left Hand of Darkness  ";
	request.author = "Ursula K. Le Guin";
	request.publication = "Ace Books";
	request.price = 15.5;

	for (auto _ : state)
	{
		auto fields = validate(request);
		benchmark::DoNotOptimize(fields);
	}
	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateCreate)->Unit(benchmark::kNanosecond);

// ============================================================================
// Pool Benchmarks
// ============================================================================

BENCHMARK_DEFINE_F(BookServiceBenchmarkFixture, PoolAcquireRelease)(benchmark::State& state)
{
	if (!ready_)
	{
		state.SkipWithError("server initialization failed");
		return;
	}

	auto& pool = app_->pool();
	for (auto _ : state)
	{
		auto connection = pool.acquire_connection();
		if (connection.is_ok())
		{
			pool.release_connection(connection.value());
		}
	}

	state.SetItemsProcessed(state.iterations());
	state.counters["acquisitions"]
		= static_cast<double>(pool.get_stats().successful_acquisitions);
}

BENCHMARK_REGISTER_F(BookServiceBenchmarkFixture, PoolAcquireRelease)
	->Unit(benchmark::kMicrosecond);

// ============================================================================
// Service Benchmarks
// ============================================================================

BENCHMARK_DEFINE_F(BookServiceBenchmarkFixture, CreateBook)(benchmark::State& state)
{
	if (!ready_)
	{
		state.SkipWithError("server initialization failed");
		return;
	}

	for (auto _ : state)
	{
		auto created = app_->books().create_book(create_request());
		benchmark::DoNotOptimize(created);
	}

	state.SetItemsProcessed(state.iterations());
}

BENCHMARK_REGISTER_F(BookServiceBenchmarkFixture, CreateBook)->Unit(benchmark::kMicrosecond);

BENCHMARK_DEFINE_F(BookServiceBenchmarkFixture, GetBook)(benchmark::State& state)
{
	if (!ready_)
	{
		state.SkipWithError("server initialization failed");
		return;
	}

	auto uids = seed(100);
	if (uids.empty())
	{
		state.SkipWithError("seeding failed");
		return;
	}

	size_t index = 0;
	for (auto _ : state)
	{
		auto fetched = app_->books().get_book(uids[index % uids.size()]);
		benchmark::DoNotOptimize(fetched);
		++index;
	}

	state.SetItemsProcessed(state.iterations());
}

BENCHMARK_REGISTER_F(BookServiceBenchmarkFixture, GetBook)->Unit(benchmark::kMicrosecond);

BENCHMARK_DEFINE_F(BookServiceBenchmarkFixture, ListBooks)(benchmark::State& state)
{
	if (!ready_)
	{
		state.SkipWithError("server initialization failed");
		return;
	}

	const auto page_size = state.range(0);
	seed(static_cast<size_t>(page_size) * 2);

	for (auto _ : state)
	{
		auto page = app_->books().list_books(0, page_size);
		benchmark::DoNotOptimize(page);
	}

	state.SetItemsProcessed(state.iterations() * page_size);
	state.counters["page_size"] = static_cast<double>(page_size);
}

BENCHMARK_REGISTER_F(BookServiceBenchmarkFixture, ListBooks)
	->Unit(benchmark::kMicrosecond)
	->Arg(10)
	->Arg(100)
	->Arg(1000);

BENCHMARK_MAIN();
