// BSD 3-Clause License
// Copyright (c) 2025, kcenon
// See the LICENSE file in the project root for full license information.

/**
 * @file resource_supervisor-metrics.cppm
 * @brief C++20 module partition for resource_supervisor metrics.
 *
 * This module partition exports:
 * - metrics_recorder and the no-op recorder
 * - metrics_registry with its configuration and export records
 * - Per-area metric structures
 *
 * Part of the kcenon.resource_supervisor module.
 */

module;

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "kcenon/resource_supervisor/metrics/metrics_recorder.h"
#include "kcenon/resource_supervisor/metrics/metrics_registry.h"
#include "kcenon/resource_supervisor/metrics/supervisor_metrics.h"

export module kcenon.resource_supervisor:metrics;

import kcenon.common;

// ============================================================================
// Recorder Interface
// ============================================================================

export namespace resource_supervisor::metrics {

using ::resource_supervisor::metrics::metrics_recorder;
using ::resource_supervisor::metrics::noop_metrics_recorder;
using ::resource_supervisor::metrics::create_noop_recorder;

} // namespace resource_supervisor::metrics

// ============================================================================
// Registry
// ============================================================================

export namespace resource_supervisor::metrics {

using ::resource_supervisor::metrics::stats_map;
using ::resource_supervisor::metrics::metrics_config;
using ::resource_supervisor::metrics::exported_metric;
using ::resource_supervisor::metrics::metrics_registry;

using ::resource_supervisor::metrics::pool_gauge_metrics;
using ::resource_supervisor::metrics::health_check_metrics;
using ::resource_supervisor::metrics::query_latency_metrics;
using ::resource_supervisor::metrics::transaction_metrics;
using ::resource_supervisor::metrics::connect_metrics;

} // namespace resource_supervisor::metrics
