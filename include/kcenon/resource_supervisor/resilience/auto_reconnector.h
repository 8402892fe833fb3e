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
 * @file auto_reconnector.h
 * @brief Reconnects a resource that reports itself disconnected
 *
 * The auto reconnector acts only on confirmed disconnection
 * (is_connected() == false), never on failed health probes. Per tick:
 *
 * 1. Skip when a reconnect is already in flight
 * 2. If connected: reset the attempt counter and return
 * 3. If max_attempts (non-zero) is reached: log a single give-up notice
 * 4. Otherwise call reconnect(); count a failure or reset on success
 *
 * The give-up notice is re-armed once the target reports connected again.
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
 * @struct auto_reconnect_options
 * @brief Auto reconnector configuration
 */
struct auto_reconnect_options
{
	std::chrono::milliseconds interval{ std::chrono::seconds(5) }; ///< Time between connectivity polls
	uint32_t max_attempts{ 0 }; ///< Failed attempts before giving up (0 = unlimited)
};

/**
 * @enum reconnect_outcome
 * @brief What a single tick did
 */
enum class reconnect_outcome
{
	in_flight,   ///< Another attempt was running, tick skipped
	connected,   ///< Target connected, counter reset
	exhausted,   ///< Attempt limit reached, nothing done
	reconnected, ///< reconnect() succeeded
	failed       ///< reconnect() failed
};

/**
 * @brief Lowercase name of an outcome
 */
[[nodiscard]] const char* to_string(reconnect_outcome outcome) noexcept;

/**
 * @class auto_reconnector
 * @brief Supervisor that re-establishes lost connections
 *
 * Thread Safety:
 * - At most one reconnect() call is in flight at any instant, even when
 *   check_now() races with the background worker
 * - get_attempts() may be read from any thread
 */
class auto_reconnector
{
	struct construction_key
	{
		explicit construction_key() = default;
	};

public:
	/**
	 * @brief Create a reconnector
	 * @param target Resource to reconnect, must outlive the reconnector
	 * @param options Poll interval and attempt limit
	 * @param deps Logger, recorder and executor (null members get defaults)
	 * @return The reconnector, or error for a null target or a
	 *         non-positive interval
	 */
	static kcenon::common::Result<std::unique_ptr<auto_reconnector>> create(
		core::recoverable* target,
		auto_reconnect_options options = {},
		core::supervisor_dependencies deps = {});

	/// Reachable only through create()
	auto_reconnector(construction_key key,
					 core::recoverable* target,
					 auto_reconnect_options options,
					 core::supervisor_dependencies deps);

	~auto_reconnector();

	auto_reconnector(const auto_reconnector&) = delete;
	auto_reconnector& operator=(const auto_reconnector&) = delete;
	auto_reconnector(auto_reconnector&&) = delete;
	auto_reconnector& operator=(auto_reconnector&&) = delete;

	kcenon::common::VoidResult start();
	kcenon::common::VoidResult start(kcenon::thread::cancellation_token token);
	void stop();

	/**
	 * @brief Run one tick synchronously
	 */
	reconnect_outcome check_now();

	/**
	 * @brief Failed attempts since the target was last connected
	 */
	[[nodiscard]] int64_t get_attempts() const;

	[[nodiscard]] bool is_reconnecting() const noexcept { return reconnecting_.load(); }
	[[nodiscard]] bool is_running() const noexcept { return worker_.is_running(); }
	[[nodiscard]] const auto_reconnect_options& options() const noexcept { return options_; }

private:
	core::recoverable* target_;
	auto_reconnect_options options_;
	core::supervisor_dependencies deps_;
	std::string name_;

	mutable std::mutex mutex_;
	int64_t attempts_{ 0 };
	bool exhaustion_logged_{ false };
	std::atomic<bool> reconnecting_{ false };

	core::periodic_worker worker_;
};

} // namespace resource_supervisor::resilience
