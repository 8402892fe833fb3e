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
 * @file query_monitor.h
 * @brief Timing and slow-query logging around foreground operations
 *
 * The query monitor wraps any operation returning a kcenon Result. When
 * enabled it measures the call, forwards the duration and error to the
 * metrics recorder and logs a warning for calls at or above the slow
 * threshold. When disabled the operation runs untouched.
 *
 * @code
 * monitoring::query_monitor monitor({ true, std::chrono::milliseconds(500) }, deps);
 *
 * auto rows = monitor.monitor("SELECT * FROM orders WHERE id = $1",
 *                             [&] { return db.select(query, id); });
 * @endcode
 */

#pragma once

#include <kcenon/resource_supervisor/core/supervisor_dependencies.h>

#include <kcenon/common/patterns/result.h>

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace resource_supervisor::monitoring
{

/**
 * @struct query_monitor_options
 * @brief Slow query monitoring configuration
 */
struct query_monitor_options
{
	bool enabled{ false };
	std::chrono::milliseconds slow_threshold{ 1000 };
};

/**
 * @class query_monitor
 * @brief Times operations and reports slow ones
 *
 * Stateless apart from its configuration. Safe to share across threads.
 */
class query_monitor
{
public:
	explicit query_monitor(query_monitor_options options = {},
						   core::supervisor_dependencies deps = {});

	/**
	 * @brief Run @p operation, timing it when monitoring is enabled
	 * @param query Statement text used in the slow-query log line
	 * @param operation Callable returning a kcenon Result or VoidResult
	 * @return Whatever @p operation returned
	 */
	template <typename Operation>
	auto monitor(const std::string& query, Operation&& operation) -> decltype(operation())
	{
		if (!options_.enabled)
		{
			return std::forward<Operation>(operation)();
		}

		const auto start = std::chrono::steady_clock::now();
		auto result = std::forward<Operation>(operation)();
		const auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
			std::chrono::steady_clock::now() - start);

		std::optional<kcenon::common::error_info> error;
		if (result.is_err())
		{
			error = result.error();
		}
		observe(query, duration, error);

		return result;
	}

	/**
	 * @brief Report an already measured query
	 */
	void observe(const std::string& query,
				 std::chrono::nanoseconds duration,
				 const std::optional<kcenon::common::error_info>& error);

	/**
	 * @brief Forward a finished transaction to the recorder
	 */
	void record_transaction(std::chrono::nanoseconds duration, bool committed);

	[[nodiscard]] bool is_enabled() const noexcept { return options_.enabled; }
	[[nodiscard]] std::chrono::milliseconds slow_threshold() const noexcept { return options_.slow_threshold; }

private:
	query_monitor_options options_;
	core::supervisor_dependencies deps_;
};

} // namespace resource_supervisor::monitoring
