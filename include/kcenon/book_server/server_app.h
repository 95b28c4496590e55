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
 * @file server_app.h
 * @brief Book server application wiring
 *
 * Builds the component graph from a server_config and owns it for the
 * lifetime of the process:
 *
 * @code
 *   console_logger -> sqlite_backend factory -> connection_pool
 *                  -> session_manager -> book_service
 * @endcode
 *
 * Usage Example:
 * @code
 *   book_server::server_app app;
 *   auto init = app.initialize(book_server::server_config::default_config());
 *   if (init.is_err()) {
 *       return 1;
 *   }
 *   auto page = app.books().list_books(0);
 *   app.shutdown();
 * @endcode
 */

#pragma once

#include "core/server_config.h"

#include <atomic>
#include <memory>
#include <ostream>
#include <string>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

// Forward declarations
namespace book_server::pooling
{
class connection_pool;
} // namespace book_server::pooling

namespace book_server::session
{
class session_manager;
} // namespace book_server::session

namespace book_server::service
{
class book_service;
} // namespace book_server::service

namespace book_server
{

/**
 * @enum server_state
 * @brief Represents the current state of the application
 */
enum class server_state
{
	uninitialized, ///< initialize() not called or failed
	initialized,   ///< Components ready for use
	stopped        ///< shutdown() completed
};

/**
 * @class server_app
 * @brief Owns the logger, pool, session manager and book service
 *
 * Thread Safety:
 * - books() may be used from any thread once initialized
 * - initialize() and shutdown() must not race each other
 */
class server_app
{
public:
	/**
	 * @brief Construct an application
	 * @param log_stream Destination of all log lines; stdout/stderr when null
	 */
	explicit server_app(std::ostream* log_stream = nullptr);

	/**
	 * @brief Destructor - ensures graceful shutdown
	 */
	~server_app();

	// Non-copyable, non-movable
	server_app(const server_app&) = delete;
	server_app& operator=(const server_app&) = delete;
	server_app(server_app&&) = delete;
	server_app& operator=(server_app&&) = delete;

	/**
	 * @brief Build all components and create the schema
	 * @param config Validated or unvalidated configuration
	 * @return ok, validation_error for a bad configuration, or
	 *         storage_error when the database cannot be opened
	 *
	 * An in-memory database URL forces a single pooled connection, because
	 * every SQLite in-memory connection is a separate database.
	 */
	kcenon::common::VoidResult initialize(const server_config& config);

	/**
	 * @brief Close idle connections and reject further acquisitions
	 */
	void shutdown();

	server_state state() const;

	const server_config& config() const;

	/**
	 * @brief Book operations; valid only after a successful initialize()
	 */
	service::book_service& books() const;

	pooling::connection_pool& pool() const;

	std::shared_ptr<kcenon::common::interfaces::ILogger> logger() const;

private:
	kcenon::common::VoidResult do_initialize();
	void do_cleanup();

	std::ostream* log_stream_;
	server_config config_;
	std::atomic<server_state> state_;

	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	std::shared_ptr<pooling::connection_pool> pool_;
	std::shared_ptr<session::session_manager> sessions_;
	std::unique_ptr<service::book_service> books_;
};

} // namespace book_server
