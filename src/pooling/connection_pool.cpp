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

#include <kcenon/book_server/pooling/connection_pool.h>

#include <kcenon/book_server/core/error_codes.h>
#include <kcenon/book_server/logging/console_logger.h>

#include <exception>
#include <vector>

namespace book_server::pooling
{

namespace
{

constexpr const char* module_name = "connection_pool";

} // namespace

connection_pool::connection_pool(const connection_pool_config& config,
								 connection_factory factory,
								 std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: config_(config)
	, factory_(std::move(factory))
	, logger_(std::move(logger))
	, shutdown_token_(kcenon::thread::cancellation_token::create())
	, shutting_down_(false)
{
	shutdown_token_.register_callback(
		[this]()
		{
			{
				std::lock_guard<std::mutex> lock(pool_mutex_);
				shutting_down_.store(true);
			}
			pool_condition_.notify_all();
		});
}

connection_pool::~connection_pool()
{
	shutdown();
}

bool connection_pool::initialize()
{
	std::vector<std::shared_ptr<connection_wrapper>> opened;
	for (size_t i = 0; i < config_.pool_size; ++i)
	{
		auto conn = create_connection();
		if (conn)
		{
			opened.push_back(std::move(conn));
		}
	}

	std::lock_guard<std::mutex> lock(pool_mutex_);
	for (auto& conn : opened)
	{
		available_connections_.push(std::move(conn));
		stats_.total_connections++;
	}
	stats_.available_connections = available_connections_.size();

	log(kcenon::common::interfaces::log_level::info,
		"Connection pool initialized with " + std::to_string(opened.size()) + "/"
			+ std::to_string(config_.pool_size) + " connections (overflow "
			+ std::to_string(config_.max_overflow) + ")");

	return config_.pool_size == 0 || stats_.available_connections > 0;
}

kcenon::common::Result<std::shared_ptr<connection_wrapper>> connection_pool::acquire_connection()
{
	if (shutting_down_.load())
	{
		return make_error(error_kind::storage_error, "Pool is shutting down", module_name);
	}

	std::unique_lock<std::mutex> lock(pool_mutex_);

	auto deadline = std::chrono::steady_clock::now() + config_.acquire_timeout;

	while (true)
	{
		if (shutting_down_.load())
		{
			stats_.failed_acquisitions++;
			return make_error(error_kind::storage_error, "Pool is shutting down", module_name);
		}

		if (!available_connections_.empty())
		{
			auto conn = std::move(available_connections_.front());
			available_connections_.pop();
			stats_.available_connections = available_connections_.size();

			// Probe outside the lock; the connection is still counted in total
			lock.unlock();
			const bool usable = !conn->is_expired(config_.recycle_after) && is_alive(conn);
			lock.lock();

			if (!usable)
			{
				stats_.total_connections--;
				stats_.discarded_connections++;
				lock.unlock();
				conn.reset();
				lock.lock();
				continue;
			}

			stats_.active_connections++;
			stats_.successful_acquisitions++;
			conn->update_last_used();
			return conn;
		}

		if (stats_.total_connections < config_.max_connections())
		{
			// Reserve the slot before opening so concurrent callers cannot overshoot
			stats_.total_connections++;
			lock.unlock();
			auto conn = create_connection();
			lock.lock();

			if (conn)
			{
				stats_.active_connections++;
				stats_.successful_acquisitions++;
				return conn;
			}

			stats_.total_connections--;
			stats_.failed_acquisitions++;
			pool_condition_.notify_one();
			return make_error(error_kind::storage_error, "Failed to open database connection",
							  module_name);
		}

		if (pool_condition_.wait_until(lock, deadline) == std::cv_status::timeout
			&& available_connections_.empty()
			&& stats_.total_connections >= config_.max_connections())
		{
			stats_.failed_acquisitions++;
			lock.unlock();
			log(kcenon::common::interfaces::log_level::warning,
				"Connection acquisition timed out after "
					+ std::to_string(config_.acquire_timeout.count()) + " ms");
			return make_error(error_kind::storage_error, "Connection acquisition timeout",
							  module_name);
		}
	}
}

void connection_pool::release_connection(std::shared_ptr<connection_wrapper> connection)
{
	if (!connection)
	{
		return;
	}

	std::shared_ptr<connection_wrapper> closing;
	{
		std::lock_guard<std::mutex> lock(pool_mutex_);

		if (stats_.active_connections > 0)
		{
			stats_.active_connections--;
		}

		const bool keep = !shutting_down_.load() && connection->is_healthy()
						  && !connection->is_expired(config_.recycle_after)
						  && available_connections_.size() < config_.pool_size;

		if (keep)
		{
			available_connections_.push(std::move(connection));
			stats_.available_connections = available_connections_.size();
		}
		else
		{
			stats_.total_connections--;
			stats_.discarded_connections++;
			closing = std::move(connection);
		}
	}
	pool_condition_.notify_one();
}

void connection_pool::health_check()
{
	std::vector<std::shared_ptr<connection_wrapper>> closing;
	{
		std::lock_guard<std::mutex> lock(pool_mutex_);
		stats_.last_health_check = std::chrono::steady_clock::now();

		std::queue<std::shared_ptr<connection_wrapper>> healthy_connections;
		while (!available_connections_.empty())
		{
			auto conn = std::move(available_connections_.front());
			available_connections_.pop();

			if (conn->is_healthy() && !conn->is_expired(config_.recycle_after))
			{
				healthy_connections.push(std::move(conn));
			}
			else
			{
				stats_.total_connections--;
				stats_.discarded_connections++;
				closing.push_back(std::move(conn));
			}
		}
		available_connections_ = std::move(healthy_connections);
		stats_.available_connections = available_connections_.size();
	}

	if (!closing.empty())
	{
		log(kcenon::common::interfaces::log_level::info,
			"Health check closed " + std::to_string(closing.size()) + " connections");
		pool_condition_.notify_all();
	}
}

connection_stats connection_pool::get_stats() const
{
	std::lock_guard<std::mutex> lock(pool_mutex_);
	return stats_;
}

size_t connection_pool::active_connections() const
{
	std::lock_guard<std::mutex> lock(pool_mutex_);
	return stats_.active_connections;
}

size_t connection_pool::available_connections() const
{
	std::lock_guard<std::mutex> lock(pool_mutex_);
	return stats_.available_connections;
}

const connection_pool_config& connection_pool::config() const noexcept
{
	return config_;
}

void connection_pool::request_shutdown()
{
	shutdown_token_.cancel();
}

void connection_pool::shutdown()
{
	request_shutdown();

	std::queue<std::shared_ptr<connection_wrapper>> closing;
	{
		std::lock_guard<std::mutex> lock(pool_mutex_);
		if (shutting_down_.load() && available_connections_.empty())
		{
			return;
		}
		shutting_down_.store(true);
		closing.swap(available_connections_);
		stats_.total_connections -= closing.size();
		stats_.available_connections = 0;
	}
	pool_condition_.notify_all();

	log(kcenon::common::interfaces::log_level::info,
		"Connection pool shut down, closed " + std::to_string(closing.size())
			+ " idle connections");
}

bool connection_pool::is_shutting_down() const
{
	return shutting_down_.load();
}

std::shared_ptr<connection_wrapper> connection_pool::create_connection()
{
	try
	{
		auto db = factory_();
		if (db)
		{
			return std::make_shared<connection_wrapper>(std::move(db));
		}
		log(kcenon::common::interfaces::log_level::error, "Failed to open database connection");
	}
	catch (const std::exception& e)
	{
		log(kcenon::common::interfaces::log_level::error,
			std::string("Failed to open database connection: ") + e.what());
	}
	return nullptr;
}

bool connection_pool::is_alive(const std::shared_ptr<connection_wrapper>& connection) const
{
	auto db = connection->get();
	if (!db || !db->is_initialized())
	{
		return false;
	}
	if (!config_.pre_ping)
	{
		return true;
	}

	auto ping = db->select_query("SELECT 1");
	if (ping.is_err())
	{
		log(kcenon::common::interfaces::log_level::warning,
			"Discarding dead connection: " + ping.error().message);
		connection->mark_unhealthy();
		return false;
	}
	return true;
}

void connection_pool::log(kcenon::common::interfaces::log_level level,
						  const std::string& message) const
{
	logging::write_log(logger_, level, message);
}

} // namespace book_server::pooling
