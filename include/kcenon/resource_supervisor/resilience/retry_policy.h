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
 * @file retry_policy.h
 * @brief Exponential backoff for the initial connection of a resource
 *
 * Used by the owning plugin while it opens its pool, before any supervisor
 * is running. Each attempt is reported to the metrics recorder:
 * - every call: connect_attempt
 * - every call after the first: connect_retry
 * - each outcome: connect_success or connect_failure
 *
 * @code
 * resilience::backoff_policy policy;
 * policy.max_attempts = 5;
 *
 * auto result = resilience::connect_with_retry(
 *     [&] { return pool.open(dsn); }, policy, deps, "orders-db", shutdown_token);
 * @endcode
 */

#pragma once

#include <kcenon/resource_supervisor/core/supervisor_dependencies.h>

#include <kcenon/common/patterns/result.h>
#include <kcenon/thread/core/cancellation_token.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace resource_supervisor::resilience
{

/**
 * @struct backoff_policy
 * @brief Retry limits and delay growth
 */
struct backoff_policy
{
	std::chrono::milliseconds initial_delay{ std::chrono::seconds(1) };
	std::chrono::milliseconds max_delay{ std::chrono::seconds(30) };
	double multiplier{ 2.0 };
	uint32_t max_attempts{ 3 }; ///< Total connect calls, including the first

	/**
	 * @brief Delay to wait after the failed attempt with index @p attempt
	 * @param attempt Zero-based index of the attempt that just failed
	 * @return min(initial_delay * multiplier^attempt, max_delay)
	 */
	[[nodiscard]] std::chrono::milliseconds delay_for(uint32_t attempt) const;

	[[nodiscard]] bool validate() const;
	[[nodiscard]] std::vector<std::string> validation_errors() const;
};

/**
 * @brief Connect operation retried by connect_with_retry()
 */
using connect_function = std::function<kcenon::common::VoidResult()>;

/**
 * @brief Call @p connect until it succeeds or the policy is exhausted
 * @param connect Operation that opens the resource
 * @param policy Attempt limit and backoff
 * @param deps Logger and recorder (null members get defaults)
 * @param name Resource name for log lines
 * @param token Optional shutdown signal that interrupts backoff sleeps
 * @return ok() on success, retry_exhausted with the last error otherwise,
 *         or retry_cancelled when @p token fires while waiting
 */
kcenon::common::VoidResult connect_with_retry(
	const connect_function& connect,
	const backoff_policy& policy,
	const core::supervisor_dependencies& deps,
	const std::string& name,
	std::optional<kcenon::thread::cancellation_token> token = std::nullopt);

} // namespace resource_supervisor::resilience
