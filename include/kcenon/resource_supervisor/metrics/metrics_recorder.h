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
 * @file metrics_recorder.h
 * @brief Sink contract for supervisor observations
 *
 * Supervisors never reference a concrete metrics system. Everything they
 * observe (pool snapshots, health results, query timings, connect outcomes)
 * is handed to a metrics_recorder injected at construction. When no sink is
 * configured the noop_metrics_recorder keeps observability at zero cost.
 *
 * ## Thread Safety
 * Implementations must accept concurrent calls from every supervisor
 * worker and from foreground query paths. Calls must not block on I/O.
 */

#pragma once

#include <kcenon/resource_supervisor/core/pool_snapshot.h>

#include <kcenon/common/patterns/result.h>

#include <chrono>
#include <memory>
#include <optional>

namespace resource_supervisor::metrics
{

/**
 * @class metrics_recorder
 * @brief Abstract sink for structured observations
 */
class metrics_recorder
{
public:
	virtual ~metrics_recorder() = default;

	/**
	 * @brief Record the gauges and cumulative counters of a pool snapshot
	 */
	virtual void record_pool_stats(const core::pool_snapshot& snapshot) = 0;

	/**
	 * @brief Record the outcome of one health probe
	 */
	virtual void record_health_check(bool success) = 0;

	/**
	 * @brief Record one query execution
	 * @param duration Wall time of the query
	 * @param error Error returned by the query, if any
	 * @param slow_threshold Duration at or above which the query counts as slow
	 */
	virtual void record_query(std::chrono::nanoseconds duration,
							  const std::optional<kcenon::common::error_info>& error,
							  std::chrono::nanoseconds slow_threshold) = 0;

	/**
	 * @brief Record one finished transaction
	 * @param duration Time from begin to commit or rollback
	 * @param committed true on commit, false on rollback
	 */
	virtual void record_tx(std::chrono::nanoseconds duration, bool committed) = 0;

	virtual void inc_connect_attempt() = 0;
	virtual void inc_connect_retry() = 0;
	virtual void inc_connect_success() = 0;
	virtual void inc_connect_failure() = 0;
};

/**
 * @class noop_metrics_recorder
 * @brief Recorder that discards everything
 */
class noop_metrics_recorder final : public metrics_recorder
{
public:
	void record_pool_stats(const core::pool_snapshot&) override {}
	void record_health_check(bool) override {}
	void record_query(std::chrono::nanoseconds,
					  const std::optional<kcenon::common::error_info>&,
					  std::chrono::nanoseconds) override {}
	void record_tx(std::chrono::nanoseconds, bool) override {}
	void inc_connect_attempt() override {}
	void inc_connect_retry() override {}
	void inc_connect_success() override {}
	void inc_connect_failure() override {}
};

/**
 * @brief Create a recorder that discards all observations
 */
inline std::shared_ptr<metrics_recorder> create_noop_recorder()
{
	return std::make_shared<noop_metrics_recorder>();
}

} // namespace resource_supervisor::metrics
