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
 * @file supervisor_metrics.h
 * @brief Atomic metric groups backing the metrics registry
 *
 * Each group is a plain struct of atomics with its own record/reset helpers:
 * - pool_gauge_metrics: latest values of every pool snapshot field
 * - health_check_metrics: probe totals
 * - query_latency_metrics: query totals, errors, slow queries and latency
 * - transaction_metrics: commit/rollback counts and durations
 * - connect_metrics: connect attempt/retry/success/failure counters
 *
 * ## Thread Safety
 * Every record call is a set of independent relaxed atomic operations.
 * Reading several related counters gives a consistent view only when no
 * writer is active. reset() is not atomic across fields.
 */

#pragma once

#include <kcenon/resource_supervisor/core/pool_snapshot.h>

#include <atomic>
#include <cstdint>
#include <limits>

namespace resource_supervisor::metrics
{

namespace detail
{

inline void update_min(std::atomic<uint64_t>& min_value, uint64_t sample) noexcept
{
	uint64_t current = min_value.load(std::memory_order_relaxed);
	while (sample < current
		   && !min_value.compare_exchange_weak(current, sample, std::memory_order_relaxed))
	{
	}
}

inline void update_max(std::atomic<uint64_t>& max_value, uint64_t sample) noexcept
{
	uint64_t current = max_value.load(std::memory_order_relaxed);
	while (sample > current
		   && !max_value.compare_exchange_weak(current, sample, std::memory_order_relaxed))
	{
	}
}

[[nodiscard]] inline double average_ns_to_ms(uint64_t total_ns, uint64_t count) noexcept
{
	if (count == 0)
	{
		return 0.0;
	}
	return static_cast<double>(total_ns) / static_cast<double>(count) / 1000000.0;
}

[[nodiscard]] inline double ns_to_seconds(uint64_t ns) noexcept
{
	return static_cast<double>(ns) / 1000000000.0;
}

} // namespace detail

/**
 * @struct pool_gauge_metrics
 * @brief Latest pool snapshot, one atomic per field
 *
 * Cumulative pool counters (wait count, wait duration, closed counts) are
 * stored as reported, never summed across snapshots.
 */
struct pool_gauge_metrics
{
	std::atomic<int64_t> max_open{ 0 };
	std::atomic<int64_t> open{ 0 };
	std::atomic<int64_t> in_use{ 0 };
	std::atomic<int64_t> idle{ 0 };
	std::atomic<int64_t> max_idle{ 0 };
	std::atomic<int64_t> wait_count{ 0 };
	std::atomic<int64_t> wait_duration_ns{ 0 };
	std::atomic<int64_t> idle_closed{ 0 };
	std::atomic<int64_t> lifetime_closed{ 0 };
	std::atomic<uint64_t> snapshots_recorded{ 0 };

	void store(const core::pool_snapshot& snapshot) noexcept
	{
		max_open.store(snapshot.max_open, std::memory_order_relaxed);
		open.store(snapshot.open, std::memory_order_relaxed);
		in_use.store(snapshot.in_use, std::memory_order_relaxed);
		idle.store(snapshot.idle, std::memory_order_relaxed);
		max_idle.store(snapshot.max_idle, std::memory_order_relaxed);
		wait_count.store(snapshot.wait_count, std::memory_order_relaxed);
		wait_duration_ns.store(snapshot.wait_duration.count(), std::memory_order_relaxed);
		idle_closed.store(snapshot.idle_closed_count, std::memory_order_relaxed);
		lifetime_closed.store(snapshot.lifetime_closed_count, std::memory_order_relaxed);
		snapshots_recorded.fetch_add(1, std::memory_order_relaxed);
	}

	void reset() noexcept
	{
		store(core::pool_snapshot{});
		snapshots_recorded.store(0, std::memory_order_relaxed);
	}
};

/**
 * @struct health_check_metrics
 * @brief Totals of health probe outcomes
 */
struct health_check_metrics
{
	std::atomic<uint64_t> total{ 0 };
	std::atomic<uint64_t> success{ 0 };
	std::atomic<uint64_t> failure{ 0 };

	void record(bool ok) noexcept
	{
		total.fetch_add(1, std::memory_order_relaxed);
		if (ok)
		{
			success.fetch_add(1, std::memory_order_relaxed);
		}
		else
		{
			failure.fetch_add(1, std::memory_order_relaxed);
		}
	}

	void reset() noexcept
	{
		total.store(0, std::memory_order_relaxed);
		success.store(0, std::memory_order_relaxed);
		failure.store(0, std::memory_order_relaxed);
	}
};

/**
 * @struct query_latency_metrics
 * @brief Query counters with min/max/total latency
 */
struct query_latency_metrics
{
	std::atomic<uint64_t> total{ 0 };
	std::atomic<uint64_t> errors{ 0 };
	std::atomic<uint64_t> slow{ 0 };
	std::atomic<uint64_t> total_latency_ns{ 0 };
	std::atomic<uint64_t> min_latency_ns{ std::numeric_limits<uint64_t>::max() };
	std::atomic<uint64_t> max_latency_ns{ 0 };

	void record(uint64_t latency_ns, bool failed, bool is_slow) noexcept
	{
		total.fetch_add(1, std::memory_order_relaxed);
		total_latency_ns.fetch_add(latency_ns, std::memory_order_relaxed);
		if (failed)
		{
			errors.fetch_add(1, std::memory_order_relaxed);
		}
		if (is_slow)
		{
			slow.fetch_add(1, std::memory_order_relaxed);
		}
		detail::update_min(min_latency_ns, latency_ns);
		detail::update_max(max_latency_ns, latency_ns);
	}

	[[nodiscard]] double avg_latency_ms() const noexcept
	{
		return detail::average_ns_to_ms(total_latency_ns.load(std::memory_order_relaxed),
										total.load(std::memory_order_relaxed));
	}

	/**
	 * @brief Minimum latency, or 0 when nothing was recorded
	 */
	[[nodiscard]] uint64_t min_latency() const noexcept
	{
		return total.load(std::memory_order_relaxed) == 0
				   ? 0
				   : min_latency_ns.load(std::memory_order_relaxed);
	}

	void reset() noexcept
	{
		total.store(0, std::memory_order_relaxed);
		errors.store(0, std::memory_order_relaxed);
		slow.store(0, std::memory_order_relaxed);
		total_latency_ns.store(0, std::memory_order_relaxed);
		min_latency_ns.store(std::numeric_limits<uint64_t>::max(), std::memory_order_relaxed);
		max_latency_ns.store(0, std::memory_order_relaxed);
	}
};

/**
 * @struct transaction_metrics
 * @brief Commit and rollback counts with accumulated durations
 */
struct transaction_metrics
{
	std::atomic<uint64_t> commits{ 0 };
	std::atomic<uint64_t> rollbacks{ 0 };
	std::atomic<uint64_t> commit_duration_ns{ 0 };
	std::atomic<uint64_t> rollback_duration_ns{ 0 };

	void record(uint64_t duration_ns, bool committed) noexcept
	{
		if (committed)
		{
			commits.fetch_add(1, std::memory_order_relaxed);
			commit_duration_ns.fetch_add(duration_ns, std::memory_order_relaxed);
		}
		else
		{
			rollbacks.fetch_add(1, std::memory_order_relaxed);
			rollback_duration_ns.fetch_add(duration_ns, std::memory_order_relaxed);
		}
	}

	[[nodiscard]] uint64_t total() const noexcept
	{
		return commits.load(std::memory_order_relaxed)
			   + rollbacks.load(std::memory_order_relaxed);
	}

	void reset() noexcept
	{
		commits.store(0, std::memory_order_relaxed);
		rollbacks.store(0, std::memory_order_relaxed);
		commit_duration_ns.store(0, std::memory_order_relaxed);
		rollback_duration_ns.store(0, std::memory_order_relaxed);
	}
};

/**
 * @struct connect_metrics
 * @brief Connection establishment counters
 */
struct connect_metrics
{
	std::atomic<uint64_t> attempts{ 0 };
	std::atomic<uint64_t> retries{ 0 };
	std::atomic<uint64_t> successes{ 0 };
	std::atomic<uint64_t> failures{ 0 };

	void reset() noexcept
	{
		attempts.store(0, std::memory_order_relaxed);
		retries.store(0, std::memory_order_relaxed);
		successes.store(0, std::memory_order_relaxed);
		failures.store(0, std::memory_order_relaxed);
	}
};

} // namespace resource_supervisor::metrics
