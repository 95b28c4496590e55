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

#include <kcenon/book_server/service/book_service.h>

#include <kcenon/book_server/core/error_codes.h>
#include <kcenon/book_server/logging/console_logger.h>
#include <kcenon/book_server/storage/book_store.h>

#include <algorithm>

namespace book_server::service
{

book_service::book_service(std::shared_ptr<session::session_manager> sessions,
						   service_config config,
						   std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: sessions_(std::move(sessions)), config_(config), logger_(std::move(logger))
{
}

kcenon::common::VoidResult book_service::initialize_schema()
{
	auto result = sessions_->execute([](database::core::database_backend& db)
									 { return storage::book_store(db).create_schema(); });
	if (result.is_err())
	{
		log_failure("initialize schema", result.error());
		return result;
	}
	log_info("Book schema ready");
	return result;
}

kcenon::common::Result<model::book> book_service::create_book(
	const model::book_create& request, const kcenon::thread::cancellation_token* token)
{
	auto fields = model::validate(request);
	if (fields.is_err())
	{
		log_failure("create book", fields.error());
		return fields.error();
	}

	const auto& validated = fields.value();
	auto result = sessions_->execute([&validated](database::core::database_backend& db)
									 { return storage::book_store(db).insert(validated); },
									 token);
	if (result.is_err())
	{
		log_failure("create book", result.error());
		return result;
	}
	log_info("Created book " + result.value().uid);
	return result;
}

kcenon::common::Result<model::book> book_service::get_book(
	std::string_view uid, const kcenon::thread::cancellation_token* token)
{
	auto result = sessions_->execute([uid](database::core::database_backend& db)
									 { return storage::book_store(db).get(uid); },
									 token);
	if (result.is_err())
	{
		log_failure("get book", result.error());
		return result;
	}
	log_info("Fetched book " + result.value().uid);
	return result;
}

kcenon::common::Result<model::book_page> book_service::list_books(
	int64_t skip, std::optional<int64_t> limit, const kcenon::thread::cancellation_token* token)
{
	const auto window = normalize_window(skip, limit, config_);

	auto result = sessions_->execute([window](database::core::database_backend& db)
									 { return storage::book_store(db).list(window.skip, window.limit); },
									 token);
	if (result.is_err())
	{
		log_failure("list books", result.error());
		return result;
	}
	log_info("Listed " + std::to_string(result.value().books.size()) + " of "
			 + std::to_string(result.value().total_count) + " books (skip "
			 + std::to_string(window.skip) + ", limit " + std::to_string(window.limit) + ")");
	return result;
}

kcenon::common::Result<model::book> book_service::update_book(
	std::string_view uid,
	const model::book_update& request,
	const kcenon::thread::cancellation_token* token)
{
	auto changes = model::validate(request);
	if (changes.is_err())
	{
		log_failure("update book", changes.error());
		return changes.error();
	}

	const auto& validated = changes.value();
	auto result = sessions_->execute([uid, &validated](database::core::database_backend& db)
									 { return storage::book_store(db).update(uid, validated); },
									 token);
	if (result.is_err())
	{
		log_failure("update book", result.error());
		return result;
	}
	log_info(validated.empty() ? "Update of book " + result.value().uid + " carried no fields"
							   : "Updated book " + result.value().uid);
	return result;
}

kcenon::common::VoidResult book_service::delete_book(
	std::string_view uid, const kcenon::thread::cancellation_token* token)
{
	auto result = sessions_->execute([uid](database::core::database_backend& db)
									 { return storage::book_store(db).remove(uid); },
									 token);
	if (result.is_err())
	{
		log_failure("delete book", result.error());
		return result;
	}
	log_info("Deleted book " + std::string(uid));
	return result;
}

page_window book_service::normalize_window(int64_t skip,
										   std::optional<int64_t> limit,
										   const service_config& config)
{
	const uint64_t max_limit = std::max<uint64_t>(config.max_page_size, 1);

	page_window window;
	window.skip = skip > 0 ? static_cast<uint64_t>(skip) : 0;

	if (!limit)
	{
		window.limit = std::clamp<uint64_t>(config.default_page_size, 1, max_limit);
	}
	else if (*limit < 1)
	{
		window.limit = 1;
	}
	else
	{
		window.limit = std::min(static_cast<uint64_t>(*limit), max_limit);
	}
	return window;
}

void book_service::log_failure(const std::string& operation,
							   const kcenon::common::error_info& error) const
{
	using kcenon::common::interfaces::log_level;

	const auto kind = get_error_kind(error);
	const auto level = kind == error_kind::storage_error || kind == error_kind::unknown
						   ? log_level::error
						   : log_level::warning;

	logging::write_log(logger_, level,
					   "Failed to " + operation + " [" + std::string(to_string(kind)) + "]: "
						   + error.message);
}

void book_service::log_info(const std::string& message) const
{
	logging::write_log(logger_, kcenon::common::interfaces::log_level::info, message);
}

} // namespace book_server::service
