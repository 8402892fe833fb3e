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
 * @file health_checker.h
 * @brief Periodic liveness probing with automatic recovery
 *
 * The health checker polls a health_checkable target at a fixed interval
 * and keeps a small health_state:
 * - consecutive_failures counts failed probes since the last success
 * - is_healthy starts true and flips on the first failure
 * - only transitions are logged (healthy -> failing, failing -> recovered)
 *
 * When the failure streak reaches max_failures and the target is also
 * recoverable, the checker calls reconnect() once for that streak. The
 * state lock is released for the duration of reconnect() so is_healthy()
 * never blocks behind a slow reconnect. A failed recovery leaves the
 * state untouched; the next attempt happens only after a success re-arms it.
 *
 * Example:
 * @code
 * resilience::health_check_options options;
 * options.interval = std::chrono::seconds(30);
 * options.max_failures = 3;
 *
 * auto created = resilience::health_checker::create(&adapter, options, deps);
 * if (created.is_err()) { ... }
 * auto checker = std::move(created.unwrap());
 * checker->start(shutdown_token);
 *
 * if (!checker->is_healthy()) { ... }
 * @endcode
 */

#pragma once

#include <kcenon/resource_supervisor/core/capabilities.h>
#include <kcenon/resource_supervisor/core/periodic_worker.h>
#include <kcenon/resource_supervisor/core/supervisor_dependencies.h>

#include <kcenon/common/patterns/result.h>
#include <kcenon/thread/core/cancellation_token.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace resource_supervisor::resilience
{

/**
 * @struct health_check_options
 * @brief Health checker configuration
 */
struct health_check_options
{
	std::chrono::milliseconds interval{ std::chrono::seconds(30) }; ///< Time between probes
	std::string custom_query; ///< Probe payload for the target, opaque to the checker
	uint32_t max_failures{ 3 }; ///< Failure streak that triggers recovery
};

/**
 * @struct health_state
 * @brief Result of the most recent probe cycle
 */
struct health_state
{
	std::chrono::system_clock::time_point last_check_time;
	bool is_healthy{ true };
	uint32_t consecutive_failures{ 0 };
};

/**
 * @class health_checker
 * @brief Supervisor that probes liveness and triggers recovery
 *
 * Thread Safety:
 * - is_healthy(), get_state() and the counters may be read from any thread
 * - Probe cycles never overlap, whether driven by the worker or check_now()
 */
class health_checker
{
	struct construction_key
	{
		explicit construction_key() = default;
	};

public:
	/**
	 * @brief Create a checker
	 * @param target Probe target, must outlive the checker
	 * @param options Interval, custom query and failure threshold
	 * @param deps Logger, recorder and executor (null members get defaults)
	 * @param recovery Recovery capability; when null, @p target is used if
	 *        it is itself recoverable
	 * @return The checker, or error for a null target, a non-positive
	 *         interval or a zero failure threshold
	 */
	static kcenon::common::Result<std::unique_ptr<health_checker>> create(
		core::health_checkable* target,
		health_check_options options = {},
		core::supervisor_dependencies deps = {},
		core::recoverable* recovery = nullptr);

	/// Reachable only through create()
	health_checker(construction_key key,
				   core::health_checkable* target,
				   core::recoverable* recovery,
				   health_check_options options,
				   core::supervisor_dependencies deps);

	~health_checker();

	health_checker(const health_checker&) = delete;
	health_checker& operator=(const health_checker&) = delete;
	health_checker(health_checker&&) = delete;
	health_checker& operator=(health_checker&&) = delete;

	/**
	 * @brief Start periodic probing (non-blocking)
	 */
	kcenon::common::VoidResult start();

	/**
	 * @brief Start periodic probing until @p token is cancelled
	 */
	kcenon::common::VoidResult start(kcenon::thread::cancellation_token token);

	/**
	 * @brief Stop probing; repeated calls have no effect
	 */
	void stop();

	/**
	 * @brief Run one probe cycle synchronously
	 * @return State after the cycle
	 */
	health_state check_now();

	[[nodiscard]] bool is_healthy() const;
	[[nodiscard]] uint32_t consecutive_failures() const;
	[[nodiscard]] health_state get_state() const;

	/**
	 * @brief Number of reconnect() calls made by this checker
	 */
	[[nodiscard]] uint64_t recovery_attempts() const noexcept { return recovery_attempts_.load(); }

	/**
	 * @brief Whether a recovery capability is available
	 */
	[[nodiscard]] bool can_recover() const noexcept { return recovery_ != nullptr; }

	[[nodiscard]] bool is_running() const noexcept { return worker_.is_running(); }
	[[nodiscard]] const std::string& custom_query() const noexcept { return options_.custom_query; }
	[[nodiscard]] const health_check_options& options() const noexcept { return options_; }

private:
	void attempt_recovery(std::unique_lock<std::mutex>& lock);

	core::health_checkable* target_;
	core::recoverable* recovery_;
	health_check_options options_;
	core::supervisor_dependencies deps_;
	std::string name_;

	std::mutex cycle_mutex_;
	mutable std::mutex mutex_;
	health_state state_;
	bool recovery_attempted_{ false };
	std::atomic<uint64_t> recovery_attempts_{ 0 };

	core::periodic_worker worker_;
};

} // namespace resource_supervisor::resilience
