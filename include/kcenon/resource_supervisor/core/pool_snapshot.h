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
 * @file pool_snapshot.h
 * @brief Point-in-time counters of a supervised resource pool
 *
 * A pool_snapshot is produced by the supervised resource on demand and is
 * consumed by the pool monitor, the leak detector and the metrics recorder.
 * It carries no identity beyond the moment it was taken.
 *
 * ## Thread Safety
 * Plain value type. Copies handed to supervisors are never mutated.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace resource_supervisor::core
{

/**
 * @struct pool_snapshot
 * @brief Immutable connection pool counters
 *
 * `wait_count`, `wait_duration`, `idle_closed_count` and
 * `lifetime_closed_count` are cumulative since the pool was opened.
 */
struct pool_snapshot
{
	int64_t max_open{ 0 };  ///< Maximum open connections (0 = unbounded)
	int64_t open{ 0 };      ///< Established connections, in use and idle
	int64_t in_use{ 0 };    ///< Connections currently checked out
	int64_t idle{ 0 };      ///< Idle connections
	int64_t max_idle{ 0 };  ///< Maximum idle connections
	int64_t wait_count{ 0 }; ///< Total number of waits for a connection
	std::chrono::nanoseconds wait_duration{ 0 }; ///< Total time blocked waiting
	int64_t idle_closed_count{ 0 };     ///< Closed because of the idle limit
	int64_t lifetime_closed_count{ 0 }; ///< Closed because of the lifetime limit

	/**
	 * @brief Ratio of open connections to the configured maximum
	 * @return open / max_open, or 0.0 when the pool is unbounded
	 */
	[[nodiscard]] double usage_ratio() const noexcept
	{
		if (max_open <= 0)
		{
			return 0.0;
		}
		return static_cast<double>(open) / static_cast<double>(max_open);
	}

	/**
	 * @brief True when every open connection is checked out
	 */
	[[nodiscard]] bool fully_checked_out() const noexcept
	{
		return in_use > 0 && in_use == open;
	}
};

} // namespace resource_supervisor::core
