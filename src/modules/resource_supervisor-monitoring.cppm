// BSD 3-Clause License
// Copyright (c) 2025, kcenon
// See the LICENSE file in the project root for full license information.

/**
 * @file resource_supervisor-monitoring.cppm
 * @brief C++20 module partition for resource_supervisor monitoring.
 *
 * This module partition exports:
 * - pool_monitor with thresholds, assessments and alert records
 * - leak_detector with suspicion records
 * - query_monitor for query timing
 *
 * Part of the kcenon.resource_supervisor module.
 */

module;

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/resource_supervisor/monitoring/leak_detector.h"
#include "kcenon/resource_supervisor/monitoring/pool_monitor.h"
#include "kcenon/resource_supervisor/monitoring/query_monitor.h"

export module kcenon.resource_supervisor:monitoring;

import kcenon.common;

// ============================================================================
// Pool Monitor
// ============================================================================

export namespace resource_supervisor::monitoring {

using ::resource_supervisor::monitoring::pool_thresholds;
using ::resource_supervisor::monitoring::alert_severity;
using ::resource_supervisor::monitoring::pool_assessment;
using ::resource_supervisor::monitoring::pool_alert;
using ::resource_supervisor::monitoring::pool_monitor_options;
using ::resource_supervisor::monitoring::alert_handler;
using ::resource_supervisor::monitoring::pool_monitor;

} // namespace resource_supervisor::monitoring

// ============================================================================
// Leak Detector
// ============================================================================

export namespace resource_supervisor::monitoring {

using ::resource_supervisor::monitoring::leak_kind;
using ::resource_supervisor::monitoring::leak_suspicion;
using ::resource_supervisor::monitoring::leak_detector_options;
using ::resource_supervisor::monitoring::suspicion_handler;
using ::resource_supervisor::monitoring::leak_detector;

// Re-export to_string for alert_severity and leak_kind
using ::resource_supervisor::monitoring::to_string;

} // namespace resource_supervisor::monitoring

// ============================================================================
// Query Monitor
// ============================================================================

export namespace resource_supervisor::monitoring {

using ::resource_supervisor::monitoring::query_monitor_options;
using ::resource_supervisor::monitoring::query_monitor;

} // namespace resource_supervisor::monitoring
