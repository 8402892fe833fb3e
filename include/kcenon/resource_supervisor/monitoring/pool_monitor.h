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
 * @file pool_monitor.h
 * @brief Threshold alerting on connection pool counters
 *
 * Each tick the pool monitor takes a snapshot, records it with the metrics
 * recorder and checks three independent conditions:
 *
 * | Condition          | Fires when              | Critical when          |
 * |--------------------|-------------------------|------------------------|
 * | high pool usage    | usage >= threshold      | usage >= 0.95          |
 * | high wait duration | wait_duration >= limit  | wait_duration > 2x     |
 * | high wait count    | wait_count >= limit     | wait_count > 5x        |
 *
 * Usage is only evaluated when max_open > 0.
 *
 * Firing conditions are emitted as one alert, gated by a cooldown:
 * - the first alert is always emitted
 * - afterwards alert_cooldown (60 s) must have passed since the last one
 * - an escalation into critical from a non-critical state only needs
 *   critical_cooldown (30 s)
 * - a tick with no firing condition clears the last severity, so the next
 *   alert is never treated as a repeat
 *
 * Emitted alerts are logged at warning level and handed to an optional
 * alert handler as pool_alert records.
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
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace resource_supervisor::monitoring
{

/**
 * @struct pool_thresholds
 * @brief Alert thresholds, immutable once the monitor is created
 */
struct pool_thresholds
{
	double usage_percentage{ 0.8 }; ///< Fraction of max_open, 0 < x <= 1
	std::chrono::milliseconds wait_duration{ std::chrono::seconds(5) };
	int64_t wait_count{ 10 };

	/// Usage at or above which the usage condition is critical
	static constexpr double critical_usage = 0.95;
	/// Multiple of wait_duration above which the wait condition is critical
	static constexpr int64_t critical_wait_duration_factor = 2;
	/// Multiple of wait_count above which the count condition is critical
	static constexpr int64_t critical_wait_count_factor = 5;

	[[nodiscard]] bool validate() const;
	[[nodiscard]] std::vector<std::string> validation_errors() const;
};

/**
 * @enum alert_severity
 * @brief Urgency of a pool alert
 */
enum class alert_severity
{
	none,
	warning,
	critical
};

/**
 * @brief "" for none, otherwise "warning" or "critical"
 */
[[nodiscard]] const char* to_string(alert_severity severity) noexcept;

/**
 * @struct pool_assessment
 * @brief Conditions that fired for one snapshot
 */
struct pool_assessment
{
	alert_severity severity{ alert_severity::none };
	std::vector<std::string> reasons;

	[[nodiscard]] bool fired() const noexcept { return !reasons.empty(); }
};

/**
 * @struct pool_alert
 * @brief Emitted alert with the snapshot that caused it
 */
struct pool_alert
{
	std::string resource;
	alert_severity severity{ alert_severity::warning };
	std::vector<std::string> reasons;
	core::pool_snapshot snapshot;
	std::chrono::system_clock::time_point time;

	/**
	 * @brief Log line for this alert
	 */
	[[nodiscard]] std::string describe() const;
};

/**
 * @struct pool_monitor_options
 * @brief Pool monitor configuration
 */
struct pool_monitor_options
{
	std::chrono::milliseconds interval{ std::chrono::seconds(30) };
	pool_thresholds thresholds;
	std::chrono::milliseconds alert_cooldown{ std::chrono::seconds(60) };
	std::chrono::milliseconds critical_cooldown{ std::chrono::seconds(30) };
};

/**
 * @brief Callback receiving every emitted alert
 */
using alert_handler = std::function<void(const pool_alert&)>;

/**
 * @class pool_monitor
 * @brief Supervisor raising rate-limited, severity-tagged pool alerts
 *
 * Thread Safety:
 * - Alert state is private and guarded by its own mutex
 * - The alert handler runs on the ticking thread, outside the lock
 */
class pool_monitor
{
	struct construction_key
	{
		explicit construction_key() = default;
	};

public:
	/**
	 * @brief Create a monitor
	 * @param target Pool to observe, must outlive the monitor
	 * @param options Interval, thresholds and cooldowns
	 * @param deps Logger, recorder and executor (null members get defaults)
	 * @return The monitor, or error for a null target, a non-positive
	 *         interval or invalid thresholds
	 */
	static kcenon::common::Result<std::unique_ptr<pool_monitor>> create(
		core::monitorable* target,
		pool_monitor_options options = {},
		core::supervisor_dependencies deps = {});

	/// Reachable only through create()
	pool_monitor(construction_key key,
				 core::monitorable* target,
				 pool_monitor_options options,
				 core::supervisor_dependencies deps);

	~pool_monitor();

	pool_monitor(const pool_monitor&) = delete;
	pool_monitor& operator=(const pool_monitor&) = delete;
	pool_monitor(pool_monitor&&) = delete;
	pool_monitor& operator=(pool_monitor&&) = delete;

	kcenon::common::VoidResult start();
	kcenon::common::VoidResult start(kcenon::thread::cancellation_token token);
	void stop();

	/**
	 * @brief Snapshot the pool, record it and evaluate it now
	 * @return The emitted alert, if any
	 */
	std::optional<pool_alert> check_now();

	/**
	 * @brief Apply thresholds and the cooldown gate to a snapshot
	 * @param snapshot Pool counters to evaluate
	 * @param now Monotonic time of the evaluation
	 * @return The emitted alert, or nullopt when nothing fired or the
	 *         cooldown suppressed it
	 */
	std::optional<pool_alert> evaluate(const core::pool_snapshot& snapshot,
									   std::chrono::steady_clock::time_point now);

	/**
	 * @brief Conditions and severity for a snapshot, without side effects
	 */
	[[nodiscard]] static pool_assessment assess(const core::pool_snapshot& snapshot,
												const pool_thresholds& thresholds);

	void set_alert_handler(alert_handler handler);

	[[nodiscard]] uint64_t alerts_emitted() const noexcept { return alerts_emitted_.load(); }
	[[nodiscard]] uint64_t alerts_suppressed() const noexcept { return alerts_suppressed_.load(); }
	[[nodiscard]] alert_severity last_severity() const;
	[[nodiscard]] bool is_running() const noexcept { return worker_.is_running(); }
	[[nodiscard]] const pool_monitor_options& options() const noexcept { return options_; }

private:
	core::monitorable* target_;
	pool_monitor_options options_;
	core::supervisor_dependencies deps_;
	std::string name_;

	std::mutex cycle_mutex_;
	mutable std::mutex mutex_;
	std::optional<std::chrono::steady_clock::time_point> last_alert_time_;
	alert_severity last_severity_{ alert_severity::none };
	alert_handler handler_;

	std::atomic<uint64_t> alerts_emitted_{ 0 };
	std::atomic<uint64_t> alerts_suppressed_{ 0 };

	core::periodic_worker worker_;
};

} // namespace resource_supervisor::monitoring
