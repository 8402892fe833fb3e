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
 * @file leak_detector.h
 * @brief Heuristic connection leak detection
 *
 * Every 30 seconds the detector inspects the pool counters. When any
 * connection is checked out it applies two independent heuristics:
 * - pool_saturated: max_open > 0, usage >= 0.9 and in_use == open
 * - long_wait: cumulative wait duration above the configured threshold
 *
 * Suspicions are advisory. They are logged at warning level, returned from
 * check_now() and passed to an optional handler. The detector never acts
 * on the pool. A fully utilized pool at steady peak load also matches the
 * saturation heuristic.
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
#include <string>
#include <vector>

namespace resource_supervisor::monitoring
{

/**
 * @enum leak_kind
 * @brief Heuristic that produced a suspicion
 */
enum class leak_kind
{
	pool_saturated,
	long_wait
};

[[nodiscard]] const char* to_string(leak_kind kind) noexcept;

/**
 * @struct leak_suspicion
 * @brief One advisory leak signal
 */
struct leak_suspicion
{
	leak_kind kind{ leak_kind::pool_saturated };
	std::string message;
	core::pool_snapshot snapshot;
};

/**
 * @struct leak_detector_options
 * @brief Leak detector configuration
 */
struct leak_detector_options
{
	std::chrono::milliseconds wait_threshold{ std::chrono::seconds(300) };
};

/**
 * @brief Callback receiving every reported suspicion
 */
using suspicion_handler = std::function<void(const leak_suspicion&)>;

/**
 * @class leak_detector
 * @brief Advisory supervisor flagging probable connection leaks
 */
class leak_detector
{
	struct construction_key
	{
		explicit construction_key() = default;
	};

public:
	/// Fixed time between inspections
	static constexpr std::chrono::seconds detection_interval{ 30 };
	/// Usage at or above which a fully checked-out pool is suspicious
	static constexpr double saturation_usage = 0.9;

	/**
	 * @brief Create a detector
	 * @param target Pool to observe, must outlive the detector
	 * @param options Wait threshold
	 * @param deps Logger, recorder and executor (null members get defaults)
	 * @return The detector, or error for a null target or a non-positive
	 *         wait threshold
	 */
	static kcenon::common::Result<std::unique_ptr<leak_detector>> create(
		core::monitorable* target,
		leak_detector_options options = {},
		core::supervisor_dependencies deps = {});

	/// Reachable only through create()
	leak_detector(construction_key key,
				  core::monitorable* target,
				  leak_detector_options options,
				  core::supervisor_dependencies deps);

	~leak_detector();

	leak_detector(const leak_detector&) = delete;
	leak_detector& operator=(const leak_detector&) = delete;
	leak_detector(leak_detector&&) = delete;
	leak_detector& operator=(leak_detector&&) = delete;

	kcenon::common::VoidResult start();
	kcenon::common::VoidResult start(kcenon::thread::cancellation_token token);
	void stop();

	/**
	 * @brief Inspect the pool now, logging and reporting any suspicion
	 */
	std::vector<leak_suspicion> check_now();

	/**
	 * @brief Apply both heuristics to a snapshot without side effects
	 * @param resource Name used in suspicion messages
	 * @param snapshot Pool counters
	 * @param wait_threshold Long-wait limit
	 */
	[[nodiscard]] static std::vector<leak_suspicion> inspect(
		const std::string& resource,
		const core::pool_snapshot& snapshot,
		std::chrono::nanoseconds wait_threshold);

	void set_suspicion_handler(suspicion_handler handler);

	[[nodiscard]] uint64_t suspicions_reported() const noexcept { return suspicions_reported_.load(); }
	[[nodiscard]] bool is_running() const noexcept { return worker_.is_running(); }
	[[nodiscard]] const leak_detector_options& options() const noexcept { return options_; }

private:
	core::monitorable* target_;
	leak_detector_options options_;
	core::supervisor_dependencies deps_;
	std::string name_;

	mutable std::mutex mutex_;
	suspicion_handler handler_;
	std::atomic<uint64_t> suspicions_reported_{ 0 };

	core::periodic_worker worker_;
};

} // namespace resource_supervisor::monitoring
