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

#include <kcenon/book_server/server_app.h>

#include <kcenon/book_server/core/error_codes.h>
#include <kcenon/book_server/logging/console_logger.h>
#include <kcenon/book_server/pooling/connection_pool.h>
#include <kcenon/book_server/service/book_service.h>
#include <kcenon/book_server/session/session_manager.h>
#include <kcenon/book_server/storage/sqlite_backend.h>

namespace book_server
{

namespace
{

constexpr const char* module_name = "server_app";

} // namespace

server_app::server_app(std::ostream* log_stream)
	: log_stream_(log_stream), state_(server_state::uninitialized)
{
}

server_app::~server_app()
{
	shutdown();
	do_cleanup();
}

kcenon::common::VoidResult server_app::initialize(const server_config& config)
{
	if (state_ != server_state::uninitialized)
	{
		return make_error(error_kind::validation_error, "Application already initialized",
						  module_name);
	}

	config_ = config;

	if (!config_.validate())
	{
		std::string message = "Configuration validation failed";
		for (const auto& error : config_.validation_errors())
		{
			message += "; " + error;
		}
		return make_error(error_kind::validation_error, message, module_name);
	}

	auto result = do_initialize();
	if (result.is_err())
	{
		do_cleanup();
		return result;
	}

	state_ = server_state::initialized;
	return result;
}

kcenon::common::VoidResult server_app::do_initialize()
{
	using kcenon::common::interfaces::log_level;

	const auto level = logging::parse_log_level(config_.logging.level).value_or(log_level::info);
	logger_ = std::make_shared<logging::console_logger>(level, config_.name, log_stream_,
														log_stream_);

	auto options = storage::sqlite_options::from_url(config_.database.url);
	if (!options)
	{
		return make_error(error_kind::validation_error,
						  "Unsupported database URL: " + config_.database.url, module_name);
	}
	options->busy_timeout = std::chrono::milliseconds(config_.database.busy_timeout_ms);
	options->echo = config_.database.echo;

	pooling::connection_pool_config pool_config;
	pool_config.pool_size = config_.database.pool_size;
	pool_config.max_overflow = config_.database.max_overflow;
	pool_config.acquire_timeout = std::chrono::milliseconds(config_.database.acquire_timeout_ms);
	pool_config.recycle_after = std::chrono::seconds(config_.database.recycle_seconds);
	pool_config.pre_ping = config_.database.pre_ping;

	if (options->is_memory())
	{
		// Every in-memory connection is its own database
		pool_config.pool_size = 1;
		pool_config.max_overflow = 0;
		pool_config.recycle_after = std::chrono::seconds(0);
		logging::write_log(logger_, log_level::warning,
						   "In-memory database: pool limited to a single connection");
	}

	auto factory = [sqlite = *options, logger = logger_]()
		-> std::unique_ptr<database::core::database_backend>
	{
		auto db = std::make_unique<storage::sqlite_backend>(sqlite, logger);
		auto opened = db->initialize(database::core::connection_config{});
		if (opened.is_err())
		{
			logging::write_log(logger, kcenon::common::interfaces::log_level::error,
							   opened.error().message);
			return nullptr;
		}
		return db;
	};

	pool_ = std::make_shared<pooling::connection_pool>(pool_config, factory, logger_);
	if (!pool_->initialize())
	{
		return make_error(error_kind::storage_error,
						  "Cannot open database: " + config_.database.url, module_name);
	}

	sessions_ = std::make_shared<session::session_manager>(pool_, logger_);

	service::service_config limits;
	limits.default_page_size = config_.service.default_page_size;
	limits.max_page_size = config_.service.max_page_size;
	books_ = std::make_unique<service::book_service>(sessions_, limits, logger_);

	auto schema = books_->initialize_schema();
	if (schema.is_err())
	{
		return schema;
	}

	logging::write_log(logger_, log_level::info,
					   "Server '" + config_.name + "' initialized with " + options->path
						   + " (pool " + std::to_string(pool_config.pool_size) + "+"
						   + std::to_string(pool_config.max_overflow) + ")");
	return kcenon::common::ok();
}

void server_app::shutdown()
{
	if (state_ != server_state::initialized)
	{
		return;
	}

	if (pool_)
	{
		pool_->request_shutdown();
		pool_->shutdown();
	}
	state_ = server_state::stopped;
	logging::write_log(logger_, kcenon::common::interfaces::log_level::info, "Shutdown complete");
}

void server_app::do_cleanup()
{
	books_.reset();
	sessions_.reset();
	pool_.reset();
}

server_state server_app::state() const
{
	return state_.load();
}

const server_config& server_app::config() const
{
	return config_;
}

service::book_service& server_app::books() const
{
	return *books_;
}

pooling::connection_pool& server_app::pool() const
{
	return *pool_;
}

std::shared_ptr<kcenon::common::interfaces::ILogger> server_app::logger() const
{
	return logger_;
}

} // namespace book_server
