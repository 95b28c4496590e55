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
 * @file session_manager.h
 * @brief Scoped unit of work over a pooled connection
 *
 * A session borrows one connection from the pool, opens a transaction,
 * runs a caller-supplied function against the connection and then commits
 * on success or rolls back on any failure. The connection goes back to the
 * pool on every exit path, including exceptions thrown by the function.
 *
 * State progression of one session:
 * @code
 *   idle -> acquiring -> in_transaction -> committing   -> released
 *                                       \-> rolling_back -> released
 * @endcode
 *
 * ### Example Usage
 * @code
 * book_server::session::session_manager sessions(pool, logger);
 *
 * auto result = sessions.execute(
 *     [&](database::core::database_backend& db) {
 *         return book_server::storage::book_store(db).get(uid);
 *     });
 * @endcode
 */

#pragma once

#include <kcenon/book_server/core/error_codes.h>
#include <kcenon/book_server/pooling/connection_pool.h>

#include <database/core/database_backend.h>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <kcenon/thread/core/cancellation_token.h>

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace book_server::session
{

/**
 * @enum session_state
 * @brief Lifecycle stage of a unit of work
 */
enum class session_state
{
	idle,           ///< Not started
	acquiring,      ///< Waiting for a pooled connection
	in_transaction, ///< Transaction open, work running
	committing,     ///< Work succeeded, commit in progress
	rolling_back,   ///< Work or commit failed, rollback in progress
	released,       ///< Connection returned to the pool
};

/**
 * @brief Convert session_state to string representation
 */
constexpr std::string_view to_string(session_state state) noexcept
{
	switch (state)
	{
	case session_state::idle:
		return "idle";
	case session_state::acquiring:
		return "acquiring";
	case session_state::in_transaction:
		return "in_transaction";
	case session_state::committing:
		return "committing";
	case session_state::rolling_back:
		return "rolling_back";
	case session_state::released:
		return "released";
	default:
		return "unknown";
	}
}

/**
 * @class connection_lease
 * @brief Returns a pooled connection on destruction
 */
class connection_lease
{
public:
	connection_lease(pooling::connection_pool& pool,
					 std::shared_ptr<pooling::connection_wrapper> connection)
		: pool_(pool), connection_(std::move(connection))
	{
	}

	~connection_lease() { release(); }

	connection_lease(const connection_lease&) = delete;
	connection_lease& operator=(const connection_lease&) = delete;

	pooling::connection_wrapper& operator*() const { return *connection_; }
	pooling::connection_wrapper* operator->() const { return connection_.get(); }

	void release()
	{
		if (connection_)
		{
			pool_.release_connection(std::move(connection_));
			connection_.reset();
		}
	}

private:
	pooling::connection_pool& pool_;
	std::shared_ptr<pooling::connection_wrapper> connection_;
};

/**
 * @class session_manager
 * @brief Runs functions inside pooled, transactional units of work
 *
 * ### Thread Safety
 * execute() may be called concurrently; each call owns its own connection.
 */
class session_manager
{
public:
	using state_observer = std::function<void(session_state)>;

	explicit session_manager(std::shared_ptr<pooling::connection_pool> pool,
							 std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	/**
	 * @brief Run work inside a transaction on a pooled connection
	 *
	 * @tparam Func Callable taking database::core::database_backend& and
	 *         returning a kcenon::common::Result<T> or VoidResult
	 * @param work Function to run; its error result triggers rollback and
	 *        is returned unchanged
	 * @param token Optional cancellation; checked before acquiring and
	 *        before committing
	 * @return Result of work after a successful commit, or storage_error
	 *         when the connection, the transaction or the work itself fails
	 *
	 * A std::exception thrown by work becomes storage_error. Any other
	 * exception propagates after the transaction is rolled back and the
	 * connection returned.
	 */
	template <typename Func>
	auto execute(Func&& work, const kcenon::thread::cancellation_token* token = nullptr)
		-> decltype(work(std::declval<database::core::database_backend&>()))
	{
		using result_type = decltype(work(std::declval<database::core::database_backend&>()));

		if (token && token->is_cancelled())
		{
			return cancelled();
		}

		notify(session_state::acquiring);
		auto acquired = pool_->acquire_connection();
		if (acquired.is_err())
		{
			notify(session_state::released);
			return acquired.error();
		}

		std::optional<result_type> outcome;
		{
			connection_lease lease(*pool_, acquired.value());

			auto begun = lease->get()->begin_transaction();
			if (begun.is_err())
			{
				lease.release();
				notify(session_state::released);
				return make_error(error_kind::storage_error,
								  "Failed to begin transaction: " + begun.error().message,
								  module_name);
			}

			notify(session_state::in_transaction);
			// Destroyed before the lease, so an escaping exception rolls back first
			transaction_guard transaction(*this, *lease);
			try
			{
				outcome.emplace(work(*lease->get()));
			}
			catch (const std::exception& e)
			{
				transaction.rollback();
				lease.release();
				notify(session_state::released);
				return make_error(error_kind::storage_error,
								  std::string("Unit of work failed: ") + e.what(), module_name);
			}

			if (outcome->is_err())
			{
				transaction.rollback();
			}
			else if (token && token->is_cancelled())
			{
				transaction.rollback();
				outcome.emplace(cancelled());
			}
			else
			{
				auto committed = transaction.commit();
				if (committed.is_err())
				{
					outcome.emplace(committed.error());
				}
			}
		}
		notify(session_state::released);
		return std::move(*outcome);
	}

	/**
	 * @brief Observe state transitions of every session
	 *
	 * Called synchronously from the executing thread.
	 */
	void set_state_observer(state_observer observer);

	[[nodiscard]] pooling::connection_pool& pool() const noexcept { return *pool_; }

private:
	static constexpr const char* module_name = "session_manager";

	/**
	 * @class transaction_guard
	 * @brief Rolls back an open transaction unless it was committed
	 *
	 * Covers exceptions that execute() does not translate into a result.
	 */
	class transaction_guard
	{
	public:
		transaction_guard(session_manager& manager, pooling::connection_wrapper& connection)
			: manager_(manager), connection_(connection), open_(true)
		{
		}

		~transaction_guard() { rollback(); }

		transaction_guard(const transaction_guard&) = delete;
		transaction_guard& operator=(const transaction_guard&) = delete;

		kcenon::common::VoidResult commit()
		{
			open_ = false;
			return manager_.commit(connection_);
		}

		void rollback()
		{
			if (open_)
			{
				open_ = false;
				manager_.rollback(connection_);
			}
		}

	private:
		session_manager& manager_;
		pooling::connection_wrapper& connection_;
		bool open_;
	};

	kcenon::common::VoidResult commit(pooling::connection_wrapper& connection);
	void rollback(pooling::connection_wrapper& connection);
	kcenon::common::error_info cancelled() const;
	void notify(session_state state) const;

	std::shared_ptr<pooling::connection_pool> pool_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;

	mutable std::mutex observer_mutex_;
	state_observer observer_;
};

} // namespace book_server::session
