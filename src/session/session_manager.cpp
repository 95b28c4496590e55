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

#include <kcenon/book_server/session/session_manager.h>

#include <kcenon/book_server/logging/console_logger.h>

namespace book_server::session
{

session_manager::session_manager(std::shared_ptr<pooling::connection_pool> pool,
								 std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: pool_(std::move(pool)), logger_(std::move(logger))
{
}

void session_manager::set_state_observer(state_observer observer)
{
	std::lock_guard<std::mutex> lock(observer_mutex_);
	observer_ = std::move(observer);
}

kcenon::common::VoidResult session_manager::commit(pooling::connection_wrapper& connection)
{
	notify(session_state::committing);

	auto committed = connection->commit_transaction();
	if (committed.is_ok())
	{
		return kcenon::common::ok();
	}

	logging::write_log(logger_, kcenon::common::interfaces::log_level::error,
					   "Commit failed: " + committed.error().message);
	rollback(connection);
	return make_error(error_kind::storage_error,
					  "Failed to commit transaction: " + committed.error().message, module_name);
}

void session_manager::rollback(pooling::connection_wrapper& connection)
{
	notify(session_state::rolling_back);

	auto rolled_back = connection->rollback_transaction();
	if (rolled_back.is_err())
	{
		// State of the connection is unknown; the pool closes it on release
		logging::write_log(logger_, kcenon::common::interfaces::log_level::error,
						   "Rollback failed, discarding connection: "
							   + rolled_back.error().message);
		connection.mark_unhealthy();
	}
}

kcenon::common::error_info session_manager::cancelled() const
{
	logging::write_log(logger_, kcenon::common::interfaces::log_level::warning,
					   "Unit of work cancelled");
	return make_error(error_kind::storage_error, "Operation cancelled", module_name);
}

void session_manager::notify(session_state state) const
{
	std::lock_guard<std::mutex> lock(observer_mutex_);
	if (observer_)
	{
		observer_(state);
	}
}

} // namespace book_server::session
