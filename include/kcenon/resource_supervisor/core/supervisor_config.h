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
 * @file supervisor_config.h
 * @brief Settings for the supervisors of one resource
 *
 * The owning plugin has already parsed its configuration file; this layer
 * only receives plain scalar values, either by filling the struct directly
 * or through from_settings() with dotted keys.
 *
 * Recognized keys (intervals and thresholds in the unit named by the key):
 *
 * | Key                                  | Default |
 * |--------------------------------------|---------|
 * | name                                 | resource|
 * | health_check.enabled                 | true    |
 * | health_check.interval_seconds        | 30      |
 * | health_check.custom_query            | ""      |
 * | health_check.max_failures            | 3       |
 * | retry.enabled                        | true    |
 * | retry.max_attempts                   | 3       |
 * | retry.initial_delay_seconds          | 1       |
 * | retry.max_delay_seconds              | 30      |
 * | retry.multiplier                     | 2.0     |
 * | monitor.enabled                      | true    |
 * | monitor.interval_seconds             | 30      |
 * | monitor.usage_threshold              | 0.8     |
 * | monitor.wait_threshold_seconds       | 5       |
 * | monitor.wait_count_threshold         | 10      |
 * | auto_reconnect.enabled               | true    |
 * | auto_reconnect.interval_seconds      | 5       |
 * | auto_reconnect.max_attempts          | 0       |
 * | leak_detection.enabled               | false   |
 * | leak_detection.threshold_seconds     | 300     |
 * | slow_query.enabled                   | false   |
 * | slow_query.threshold_ms              | 1000    |
 * | logging.level                        | info    |
 * | metrics.enabled                      | true    |
 * | metrics.namespace                    | supervisor |
 * | metrics.subsystem                    | pool    |
 * | metrics.label.<name>                 | -       |
 *
 * Example:
 * @code
 * auto parsed = core::supervisor_config::from_settings({
 *     {"name", "orders-db"},
 *     {"monitor.usage_threshold", "0.85"},
 *     {"auto_reconnect.max_attempts", "10"},
 * });
 * if (parsed.is_ok() && parsed.value().validate()) { ... }
 * @endcode
 */

#pragma once

#include <kcenon/resource_supervisor/metrics/metrics_registry.h>
#include <kcenon/resource_supervisor/monitoring/leak_detector.h>
#include <kcenon/resource_supervisor/monitoring/pool_monitor.h>
#include <kcenon/resource_supervisor/monitoring/query_monitor.h>
#include <kcenon/resource_supervisor/resilience/auto_reconnector.h>
#include <kcenon/resource_supervisor/resilience/health_checker.h>
#include <kcenon/resource_supervisor/resilience/retry_policy.h>

#include <kcenon/common/patterns/result.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace resource_supervisor::core
{

/**
 * @brief Already-parsed plugin settings keyed by dotted name
 */
using settings_map = std::unordered_map<std::string, std::string>;

/**
 * @struct health_check_config
 * @brief Health checker settings
 */
struct health_check_config
{
	bool enabled = true;
	uint32_t interval_seconds = 30;
	std::string custom_query;       ///< Probe statement (empty = driver default)
	uint32_t max_failures = 3;
};

/**
 * @struct retry_config
 * @brief Startup connection retry settings
 */
struct retry_config
{
	bool enabled = true;
	uint32_t max_attempts = 3;
	uint32_t initial_delay_seconds = 1;
	uint32_t max_delay_seconds = 30;
	double multiplier = 2.0;
};

/**
 * @struct monitor_config
 * @brief Pool monitor settings
 */
struct monitor_config
{
	bool enabled = true;
	uint32_t interval_seconds = 30;
	double usage_threshold = 0.8;        ///< Fraction of max open connections
	uint32_t wait_threshold_seconds = 5;
	int64_t wait_count_threshold = 10;
};

/**
 * @struct auto_reconnect_config
 * @brief Auto reconnector settings
 */
struct auto_reconnect_config
{
	bool enabled = true;
	uint32_t interval_seconds = 5;
	uint32_t max_attempts = 0;           ///< 0 = unlimited
};

/**
 * @struct leak_detection_config
 * @brief Leak detector settings
 */
struct leak_detection_config
{
	bool enabled = false;
	uint32_t threshold_seconds = 300;
};

/**
 * @struct slow_query_config
 * @brief Query monitor settings
 */
struct slow_query_config
{
	bool enabled = false;
	uint32_t threshold_ms = 1000;
};

/**
 * @struct logging_config
 * @brief Logging settings for the fallback console logger
 */
struct logging_config
{
	std::string level = "info";          ///< trace, debug, info, warn, error, critical
};

/**
 * @struct supervisor_config
 * @brief All supervisor settings for one resource
 */
struct supervisor_config
{
	std::string name = "resource";
	health_check_config health_check;
	retry_config retry;
	monitor_config monitor;
	auto_reconnect_config auto_reconnect;
	leak_detection_config leak_detection;
	slow_query_config slow_query;
	logging_config logging;
	resource_supervisor::metrics::metrics_config metrics;

	/**
	 * @brief Create a default configuration
	 */
	static supervisor_config default_config();

	/**
	 * @brief Apply dotted-key settings on top of the defaults
	 * @param settings Key/value pairs; unknown keys are ignored
	 * @return The configuration, or error naming the first malformed value
	 */
	static kcenon::common::Result<supervisor_config> from_settings(const settings_map& settings);

	/**
	 * @brief Validate the configuration
	 * @return true if validation_errors() is empty
	 */
	[[nodiscard]] bool validate() const;

	/**
	 * @brief Get validation error messages
	 */
	[[nodiscard]] std::vector<std::string> validation_errors() const;

	[[nodiscard]] resilience::health_check_options to_health_check_options() const;
	[[nodiscard]] resilience::backoff_policy to_backoff_policy() const;
	[[nodiscard]] resilience::auto_reconnect_options to_auto_reconnect_options() const;
	[[nodiscard]] monitoring::pool_monitor_options to_pool_monitor_options() const;
	[[nodiscard]] monitoring::leak_detector_options to_leak_detector_options() const;
	[[nodiscard]] monitoring::query_monitor_options to_query_monitor_options() const;
};

} // namespace resource_supervisor::core
