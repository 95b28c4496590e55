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
 * @file server_config.h
 * @brief Server configuration structures
 *
 * Configuration is read once at startup, from defaults, an optional
 * key=value file and then environment overrides, and passed by reference
 * to the components that need it.
 *
 * ## Thread Safety
 * Configuration structs are plain data structures with no internal
 * synchronization. Populate them before startup, then read concurrently.
 *
 * @code
 * using namespace book_server;
 *
 * auto config = server_config::load_from_file("book_server.conf");
 * if (config.has_value()) {
 *     for (const auto& err : config->apply_environment()) {
 *         std::cerr << "Environment error: " << err << std::endl;
 *     }
 *     if (!config->validate()) {
 *         for (const auto& err : config->validation_errors()) {
 *             std::cerr << "Config error: " << err << std::endl;
 *         }
 *     }
 * }
 * @endcode
 *
 * File format:
 * @code
 * # comment
 * database.url = sqlite:///books.db
 * database.pool_size = 5
 * logging.level = debug
 * @endcode
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace book_server
{

/**
 * @struct database_config
 * @brief Storage location and connection pool sizing
 */
struct database_config
{
	std::string url = "sqlite:///books.db"; ///< Connection URL (DATABASE_URL)
	uint32_t pool_size = 5;                 ///< Idle connections kept (DB_POOL_SIZE)
	uint32_t max_overflow = 10;             ///< Extra connections under load (DB_MAX_OVERFLOW)
	bool echo = false;                      ///< Log every SQL statement (DB_ECHO)
	uint32_t acquire_timeout_ms = 30000;    ///< Max wait for a pooled connection
	uint32_t busy_timeout_ms = 5000;        ///< Max wait for an engine lock
	bool pre_ping = true;                   ///< Probe connections before use
	uint32_t recycle_seconds = 3600;        ///< Connection lifetime (0 = unlimited)
};

/**
 * @struct pagination_config
 * @brief Page size limits of the list operation
 */
struct pagination_config
{
	uint32_t default_page_size = 100;
	uint32_t max_page_size = 1000;
};

/**
 * @struct logging_config
 * @brief Logging configuration
 */
struct logging_config
{
	std::string level = "info"; ///< Log level (debug, info, warn, error) (LOG_LEVEL)
};

/**
 * @struct server_config
 * @brief Main server configuration
 */
struct server_config
{
	/// Returns the value of an environment variable, or std::nullopt if unset.
	using environment_lookup = std::function<std::optional<std::string>(const std::string&)>;

	std::string name = "book_server"; ///< Instance name, used as log tag
	database_config database;         ///< Storage configuration
	pagination_config service;        ///< List operation limits
	logging_config logging;           ///< Logging configuration

	/**
	 * @brief Load configuration from a key=value file
	 * @param path Path to the configuration file
	 * @return Loaded configuration, or std::nullopt if the file cannot be
	 *         read or holds a malformed value
	 */
	static std::optional<server_config> load_from_file(const std::string& path);

	/**
	 * @brief Create a default configuration
	 */
	static server_config default_config();

	/**
	 * @brief Apply DATABASE_URL, DB_POOL_SIZE, DB_MAX_OVERFLOW, DB_ECHO and LOG_LEVEL
	 * @param lookup Environment source; the process environment by default
	 * @return Messages for variables whose value could not be parsed;
	 *         such variables leave the configuration unchanged
	 */
	std::vector<std::string> apply_environment(const environment_lookup& lookup = {});

	/**
	 * @brief Validate the configuration
	 * @return true if configuration is valid
	 */
	bool validate() const;

	/**
	 * @brief Get validation error messages
	 * @return Vector of validation error messages
	 */
	std::vector<std::string> validation_errors() const;
};

} // namespace book_server
