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
 * @file connection_types.h
 * @brief Connection pool configuration, statistics and connection wrapper
 *
 * The pool hands out database::core::database_backend instances wrapped in
 * a connection_wrapper that tracks health, age and last use.
 */

#pragma once

#include <database/core/database_backend.h>
#include <database/database_types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace book_server::pooling
{

/**
 * @struct connection_pool_config
 * @brief Sizing and lifetime parameters of the pool
 *
 * At most pool_size + max_overflow connections exist at any time. Up to
 * pool_size idle connections are kept; overflow connections are closed when
 * released.
 */
struct connection_pool_config
{
	size_t pool_size = 5;    ///< Connections opened at startup and kept idle
	size_t max_overflow = 10; ///< Extra connections allowed under load
	std::chrono::milliseconds acquire_timeout{ 30000 }; ///< Max wait for a free slot
	std::chrono::seconds recycle_after{ 3600 }; ///< Close connections older than this (0 = never)
	bool pre_ping = true;    ///< Verify each connection with SELECT 1 before handing it out

	/**
	 * @brief Upper bound on concurrently open connections
	 */
	[[nodiscard]] size_t max_connections() const noexcept { return pool_size + max_overflow; }
};

/**
 * @struct connection_stats
 * @brief Statistics for connection pool monitoring.
 */
struct connection_stats
{
	size_t total_connections = 0;       ///< Connections currently open
	size_t active_connections = 0;      ///< Connections handed out
	size_t available_connections = 0;   ///< Idle connections in the pool
	size_t failed_acquisitions = 0;     ///< Acquisitions that timed out or failed
	size_t successful_acquisitions = 0; ///< Acquisitions that returned a connection
	size_t discarded_connections = 0;   ///< Connections closed as dead, recycled or overflow
	std::chrono::steady_clock::time_point last_health_check; ///< Last health check time
};

/**
 * @class connection_wrapper
 * @brief Database connection with pool metadata
 */
class connection_wrapper
{
public:
	explicit connection_wrapper(std::unique_ptr<database::core::database_backend> conn)
		: connection_(std::move(conn))
		, is_healthy_(true)
		, created_at_(std::chrono::steady_clock::now())
		, last_used_(created_at_)
	{
	}

	~connection_wrapper() = default;

	connection_wrapper(const connection_wrapper&) = delete;
	connection_wrapper& operator=(const connection_wrapper&) = delete;

	database::core::database_backend* get() const { return connection_.get(); }
	database::core::database_backend* operator->() const { return connection_.get(); }
	database::core::database_backend& operator*() const { return *connection_; }

	bool is_healthy() const { return is_healthy_.load(); }
	void mark_unhealthy() { is_healthy_.store(false); }

	void update_last_used()
	{
		std::lock_guard<std::mutex> lock(metadata_mutex_);
		last_used_ = std::chrono::steady_clock::now();
	}

	std::chrono::steady_clock::time_point last_used() const
	{
		std::lock_guard<std::mutex> lock(metadata_mutex_);
		return last_used_;
	}

	/**
	 * @brief Check whether the connection outlived the recycle age
	 * @param max_age Maximum lifetime; zero disables recycling
	 */
	bool is_expired(std::chrono::seconds max_age) const
	{
		if (max_age.count() <= 0)
		{
			return false;
		}
		return std::chrono::steady_clock::now() - created_at_ > max_age;
	}

private:
	std::unique_ptr<database::core::database_backend> connection_;
	std::atomic<bool> is_healthy_;
	const std::chrono::steady_clock::time_point created_at_;
	std::chrono::steady_clock::time_point last_used_;
	mutable std::mutex metadata_mutex_;
};

} // namespace book_server::pooling
