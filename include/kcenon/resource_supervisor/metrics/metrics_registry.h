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
 * @file metrics_registry.h
 * @brief Explicitly constructed in-process metrics sink
 *
 * metrics_registry is the concrete metrics_recorder shipped with the
 * library. It keeps atomic counters and gauges for everything the
 * supervisors and the query monitor observe and exports them under
 * Prometheus-style names of the form `<ns>_<subsystem>_<metric>`.
 *
 * There is no global instance. The owning plugin constructs a registry and
 * passes it to its supervisors, so tests stay hermetic.
 *
 * @code
 * using namespace resource_supervisor::metrics;
 *
 * metrics_config config = metrics_config::default_config();
 * config.subsystem = "orders_db";
 * auto registry = std::make_shared<metrics_registry>(config);
 *
 * registry->record_health_check(true);
 * for (const auto& metric : registry->export_metrics())
 * {
 *     // metric.name == "supervisor_orders_db_health_check_total", ...
 * }
 * @endcode
 */

#pragma once

#include "metrics_recorder.h"
#include "supervisor_metrics.h"

#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace resource_supervisor::metrics
{

/**
 * @brief Statistic name to value map
 */
using stats_map = std::unordered_map<std::string, double>;

/**
 * @struct metrics_config
 * @brief Registry configuration
 */
struct metrics_config
{
	bool enabled = true;                  ///< Disabled registries ignore every call
	std::string ns = "supervisor";        ///< Metric name namespace
	std::string subsystem = "pool";       ///< Metric name subsystem
	std::unordered_map<std::string, std::string> labels; ///< Labels on every metric
	std::chrono::nanoseconds slow_query_threshold = std::chrono::seconds(1); ///< Used when a caller passes no threshold

	/**
	 * @brief Default configuration
	 */
	static metrics_config default_config();

	/**
	 * @brief Check the configuration
	 * @return true when validation_errors() is empty
	 */
	[[nodiscard]] bool validate() const;

	/**
	 * @brief Describe every invalid field
	 */
	[[nodiscard]] std::vector<std::string> validation_errors() const;
};

/**
 * @struct exported_metric
 * @brief One named sample handed to an external exporter
 */
struct exported_metric
{
	std::string name;
	double value;
	std::chrono::system_clock::time_point timestamp;
	std::unordered_map<std::string, std::string> labels;
};

/**
 * @class metrics_registry
 * @brief Atomic metrics_recorder with statistics and export
 *
 * Thread Safety:
 * - All record calls are lock-free
 * - get_statistics() and export_metrics() read relaxed atomics
 */
class metrics_registry : public metrics_recorder
{
public:
	explicit metrics_registry(metrics_config config = metrics_config::default_config());
	~metrics_registry() override = default;

	metrics_registry(const metrics_registry&) = delete;
	metrics_registry& operator=(const metrics_registry&) = delete;
	metrics_registry(metrics_registry&&) = delete;
	metrics_registry& operator=(metrics_registry&&) = delete;

	void record_pool_stats(const core::pool_snapshot& snapshot) override;
	void record_health_check(bool success) override;
	void record_query(std::chrono::nanoseconds duration,
					  const std::optional<kcenon::common::error_info>& error,
					  std::chrono::nanoseconds slow_threshold) override;
	void record_tx(std::chrono::nanoseconds duration, bool committed) override;
	void inc_connect_attempt() override;
	void inc_connect_retry() override;
	void inc_connect_success() override;
	void inc_connect_failure() override;

	/**
	 * @brief Flat view of every metric keyed by its short name
	 *
	 * Keys are the metric names without namespace and subsystem, for
	 * example "open_connections" or "health_check_failure_total", plus
	 * derived values such as "query_latency_avg_ms".
	 */
	[[nodiscard]] stats_map get_statistics() const;

	/**
	 * @brief Export every metric with its fully qualified name and labels
	 */
	[[nodiscard]] std::vector<exported_metric> export_metrics() const;

	/**
	 * @brief Zero every counter and gauge
	 */
	void reset();

	/**
	 * @brief Fully qualified name of a metric
	 * @param metric Short metric name
	 * @return "<ns>_<subsystem>_<metric>", skipping empty parts
	 */
	[[nodiscard]] std::string metric_name(std::string_view metric) const;

	[[nodiscard]] bool is_enabled() const noexcept { return config_.enabled; }
	[[nodiscard]] const metrics_config& config() const noexcept { return config_; }

	[[nodiscard]] const pool_gauge_metrics& pool() const noexcept { return pool_; }
	[[nodiscard]] const health_check_metrics& health_checks() const noexcept { return health_; }
	[[nodiscard]] const query_latency_metrics& queries() const noexcept { return queries_; }
	[[nodiscard]] const transaction_metrics& transactions() const noexcept { return transactions_; }
	[[nodiscard]] const connect_metrics& connects() const noexcept { return connects_; }

private:
	metrics_config config_;

	pool_gauge_metrics pool_;
	health_check_metrics health_;
	query_latency_metrics queries_;
	transaction_metrics transactions_;
	connect_metrics connects_;
};

} // namespace resource_supervisor::metrics
