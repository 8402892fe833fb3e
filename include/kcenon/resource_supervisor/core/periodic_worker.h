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
 * @file periodic_worker.h
 * @brief Background tick loop shared by all supervisors
 *
 * A periodic_worker runs one tick function at a fixed interval on a single
 * background task until it is stopped. The task is submitted to an
 * IExecutor as an IJob when one is available, otherwise it runs on
 * std::async.
 *
 * Behavior:
 * - The first tick happens one interval after start()
 * - Ticks are strictly sequential
 * - Waiting between ticks is interruptible by stop() or by the linked
 *   cancellation token
 * - stop() is idempotent and waits at most 5 seconds for the loop,
 *   logging a warning when the loop did not drain in time
 * - A tick that throws std::exception is logged and the loop continues
 *
 * @code
 * core::periodic_worker worker(
 *     "pool_monitor", std::chrono::seconds(30),
 *     [&] { monitor.check_now(); }, logger);
 *
 * auto token = kcenon::thread::cancellation_token::create();
 * if (auto result = worker.start(token); result.is_err())
 * {
 *     // already running or token already cancelled
 * }
 * ...
 * token.cancel(); // or worker.stop();
 * @endcode
 */

#pragma once

#include <kcenon/resource_supervisor/core/stop_signal.h>

#include <kcenon/common/interfaces/executor_interface.h>
#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>
#include <kcenon/thread/core/cancellation_token.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace resource_supervisor::core
{

/**
 * @class periodic_worker
 * @brief Cancellable fixed-interval loop
 *
 * Thread Safety:
 * - start(), stop() and the accessors may be called from any thread
 * - The tick function only ever runs on the worker task
 */
class periodic_worker
{
public:
	using tick_function = std::function<void()>;

	/**
	 * @brief Maximum time stop() waits for the loop to exit
	 */
	static constexpr std::chrono::seconds stop_timeout{ 5 };

	/**
	 * @brief Construct an idle worker
	 * @param name Name used for the IJob and in log lines
	 * @param interval Time between ticks (must be positive)
	 * @param tick Work executed on every tick
	 * @param logger Logger for lifecycle warnings and tick errors
	 * @param executor Optional executor for the loop task
	 */
	periodic_worker(std::string name,
					std::chrono::milliseconds interval,
					tick_function tick,
					std::shared_ptr<kcenon::common::interfaces::ILogger> logger,
					std::shared_ptr<kcenon::common::interfaces::IExecutor> executor = nullptr);

	/**
	 * @brief Stops the loop and waits for the task to finish
	 */
	~periodic_worker();

	periodic_worker(const periodic_worker&) = delete;
	periodic_worker& operator=(const periodic_worker&) = delete;
	periodic_worker(periodic_worker&&) = delete;
	periodic_worker& operator=(periodic_worker&&) = delete;

	/**
	 * @brief Start the loop with no external stop signal
	 * @return ok(), or error when already running or the interval is invalid
	 */
	kcenon::common::VoidResult start();

	/**
	 * @brief Start the loop and stop it when @p token is cancelled
	 * @param token Shutdown signal of the owning plugin
	 * @return ok(), or error when already running, the interval is invalid
	 *         or the token is already cancelled
	 */
	kcenon::common::VoidResult start(kcenon::thread::cancellation_token token);

	/**
	 * @brief Signal the loop to exit and wait for it (bounded)
	 *
	 * Only the first call after a start has any effect.
	 */
	void stop();

	[[nodiscard]] bool is_running() const noexcept { return running_.load(); }
	[[nodiscard]] uint64_t tick_count() const noexcept { return ticks_.load(); }
	[[nodiscard]] const std::string& name() const noexcept { return name_; }
	[[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
	friend class periodic_job;

	kcenon::common::VoidResult launch(std::shared_ptr<stop_signal> signal);
	void run_loop(const std::shared_ptr<stop_signal>& signal);
	void run_tick();
	void join(std::chrono::seconds timeout);

	std::string name_;
	std::chrono::milliseconds interval_;
	tick_function tick_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor_;

	std::mutex lifecycle_mutex_;
	std::shared_ptr<stop_signal> signal_;
	std::future<void> loop_future_;
	std::atomic<bool> running_{ false };
	std::atomic<uint64_t> ticks_{ 0 };
};

} // namespace resource_supervisor::core
