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
 * @file console_logger.h
 * @brief Console logger and logging helpers for book_server
 *
 * Provides the default ILogger sink of the service together with small
 * helpers shared by every component that accepts an optional logger.
 *
 * Output format:
 * @code
 *   [2025-03-01T09:12:44.118Z] [INFO] [book_service] Created book 3f2b...
 * @endcode
 *
 * Messages below warning go to the info stream (stdout by default), warning
 * and above to the error stream (stderr by default). Streams can be replaced
 * so that tests can capture output.
 */

#pragma once

#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace book_server::logging
{

/**
 * @class console_logger
 * @brief Thread-safe ILogger writing one line per message
 *
 * Thread Safety:
 * - All logging methods are thread-safe; lines are never interleaved
 * - Level changes are atomic
 *
 * Usage:
 * @code
 *   auto logger = book_server::logging::create_console_logger(
 *       kcenon::common::interfaces::log_level::debug, "book_server");
 *   logger->log(kcenon::common::interfaces::log_level::info, std::string("ready"));
 * @endcode
 */
class console_logger : public kcenon::common::interfaces::ILogger
{
public:
	/**
	 * @brief Construct a console logger
	 * @param min_level Minimum log level to output (default: info)
	 * @param name Tag printed on every line (empty for none)
	 * @param info_stream Stream for messages below warning
	 * @param error_stream Stream for warning and above
	 */
	explicit console_logger(
		kcenon::common::interfaces::log_level min_level
		= kcenon::common::interfaces::log_level::info,
		std::string name = "",
		std::ostream* info_stream = nullptr,
		std::ostream* error_stream = nullptr);

	~console_logger() override = default;

	console_logger(const console_logger&) = delete;
	console_logger& operator=(const console_logger&) = delete;

	kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
								   const std::string& message) override;

	kcenon::common::VoidResult log(
		kcenon::common::interfaces::log_level level,
		std::string_view message,
		const kcenon::common::source_location& loc
		= kcenon::common::source_location::current()) override;

	kcenon::common::VoidResult log(
		const kcenon::common::interfaces::log_entry& entry) override;

	bool is_enabled(kcenon::common::interfaces::log_level level) const override;

	kcenon::common::VoidResult set_level(
		kcenon::common::interfaces::log_level level) override;

	kcenon::common::interfaces::log_level get_level() const override;

	kcenon::common::VoidResult flush() override;

private:
	void write_line(kcenon::common::interfaces::log_level level,
					std::string_view message,
					std::string_view file = {},
					int line = 0);

	std::atomic<kcenon::common::interfaces::log_level> min_level_;
	std::string name_;
	std::ostream* info_stream_;
	std::ostream* error_stream_;
	mutable std::mutex output_mutex_;
};

/**
 * @brief Factory function to create a console logger
 * @param min_level Minimum log level (default: info)
 * @param name Tag printed on every line
 * @return Shared pointer to ILogger
 */
std::shared_ptr<kcenon::common::interfaces::ILogger> create_console_logger(
	kcenon::common::interfaces::log_level min_level
	= kcenon::common::interfaces::log_level::info,
	std::string name = "");

/**
 * @brief Parse a configured level name
 * @param name One of "debug", "info", "warn", "warning", "error"
 * @return Matching level, or std::nullopt for unknown names
 */
std::optional<kcenon::common::interfaces::log_level> parse_log_level(std::string_view name);

/**
 * @brief Log through an optional logger
 *
 * Does nothing when logger is null or the level is disabled. Sink failures
 * are ignored; logging never changes the outcome of an operation.
 */
void write_log(const std::shared_ptr<kcenon::common::interfaces::ILogger>& logger,
			   kcenon::common::interfaces::log_level level,
			   const std::string& message);

} // namespace book_server::logging
