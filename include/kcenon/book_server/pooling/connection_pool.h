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
 * @file connection_pool.h
 * @brief Bounded, blocking connection pool with cooperative shutdown
 *
 * The pool is the only shared mutable resource of the service and its only
 * backpressure mechanism: callers beyond pool_size + max_overflow block in
 * acquire_connection() until a connection is released, the acquire timeout
 * expires or the pool shuts down.
 *
 * ### Lifecycle
 * 1. initialize() opens pool_size connections
 * 2. acquire_connection() / release_connection() from any thread
 * 3. request_shutdown() cancels the shutdown token; waiters wake with an error
 * 4. shutdown() closes idle connections; handed-out ones close on release
 *
 * ### Example Usage
 * @code
 * book_server::pooling::connection_pool_config config;
 * config.pool_size = 5;
 * config.max_overflow = 10;
 *
 * auto factory = [&]() -> std::unique_ptr<database::core::database_backend> {
 *     auto db = std::make_unique<book_server::storage::sqlite_backend>(options);
 *     if (db->initialize(database::core::connection_config{}).is_err()) {
 *         return nullptr;
 *     }
 *     return db;
 * };
 *
 * auto pool = std::make_shared<book_server::pooling::connection_pool>(config, factory);
 * if (!pool->initialize()) {
 *     // storage unreachable
 * }
 *
 * auto result = pool->acquire_connection();
 * if (result.is_ok()) {
 *     auto conn = result.value();
 *     conn->get()->select_query("SELECT 1");
 *     pool->release_connection(conn);
 * }
 * @endcode
 */

#pragma once

#include "connection_types.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <kcenon/thread/core/cancellation_token.h>

namespace book_server::pooling
{

/**
 * @class connection_pool
 * @brief Thread-safe pool of database backend connections
 *
 * ### Thread Safety
 * All methods are thread-safe and can be called from multiple threads concurrently.
 */
class connection_pool
{
public:
	/// Opens one connected backend; returns nullptr on failure.
	using connection_factory = std::function<std::unique_ptr<database::core::database_backend>()>;

	/**
	 * @brief Constructs the pool without opening connections
	 * @param config Pool sizing configuration
	 * @param factory Function opening new database connections
	 * @param logger Optional logger for pool events
	 */
	connection_pool(const connection_pool_config& config,
					connection_factory factory,
					std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	/**
	 * @brief Destructor - shuts the pool down
	 */
	~connection_pool();

	connection_pool(const connection_pool&) = delete;
	connection_pool& operator=(const connection_pool&) = delete;
	connection_pool(connection_pool&&) = delete;
	connection_pool& operator=(connection_pool&&) = delete;

	/**
	 * @brief Opens pool_size connections
	 * @return true if at least one connection could be opened
	 */
	bool initialize();

	/**
	 * @brief Acquires a connection, blocking while the pool is saturated
	 * @return Connection on success; storage_error on timeout, shutdown or
	 *         when no connection can be opened
	 */
	kcenon::common::Result<std::shared_ptr<connection_wrapper>> acquire_connection();

	/**
	 * @brief Returns a connection to the pool
	 * @param connection Connection obtained from acquire_connection()
	 *
	 * Unhealthy, expired and surplus overflow connections are closed instead
	 * of being kept. Null connections are ignored.
	 */
	void release_connection(std::shared_ptr<connection_wrapper> connection);

	/**
	 * @brief Closes idle connections that are unhealthy or expired
	 */
	void health_check();

	[[nodiscard]] connection_stats get_stats() const;

	[[nodiscard]] size_t active_connections() const;

	[[nodiscard]] size_t available_connections() const;

	[[nodiscard]] const connection_pool_config& config() const noexcept;

	/**
	 * @brief Requests graceful shutdown via cancellation token
	 *
	 * Does not block. Callers waiting in acquire_connection() return an error.
	 */
	void request_shutdown();

	/**
	 * @brief Shuts down the pool and closes idle connections
	 */
	void shutdown();

	[[nodiscard]] bool is_shutting_down() const;

private:
	std::shared_ptr<connection_wrapper> create_connection();

	/**
	 * @brief Runs the pre-ping probe on a connection about to be handed out
	 */
	bool is_alive(const std::shared_ptr<connection_wrapper>& connection) const;

	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	connection_pool_config config_;
	connection_factory factory_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;

	mutable std::mutex pool_mutex_;
	std::condition_variable pool_condition_;
	std::queue<std::shared_ptr<connection_wrapper>> available_connections_;
	connection_stats stats_;

	kcenon::thread::cancellation_token shutdown_token_;
	std::atomic<bool> shutting_down_;
};

} // namespace book_server::pooling
