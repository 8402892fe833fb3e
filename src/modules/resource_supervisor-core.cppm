// BSD 3-Clause License
// Copyright (c) 2025, kcenon
// See the LICENSE file in the project root for full license information.

/**
 * @file resource_supervisor-core.cppm
 * @brief C++20 module partition for resource_supervisor core components.
 *
 * This module partition exports:
 * - Capability interfaces implemented by supervised resources
 * - pool_snapshot and the shared periodic_worker
 * - supervisor_config and supervisor_dependencies
 * - supervisor_group and the console logger
 *
 * Part of the kcenon.resource_supervisor module.
 */

module;

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "kcenon/resource_supervisor/core/capabilities.h"
#include "kcenon/resource_supervisor/core/error_codes.h"
#include "kcenon/resource_supervisor/core/periodic_worker.h"
#include "kcenon/resource_supervisor/core/pool_snapshot.h"
#include "kcenon/resource_supervisor/core/stop_signal.h"
#include "kcenon/resource_supervisor/core/supervisor_config.h"
#include "kcenon/resource_supervisor/core/supervisor_dependencies.h"
#include "kcenon/resource_supervisor/logging/console_logger.h"
#include "kcenon/resource_supervisor/supervisor_group.h"

export module kcenon.resource_supervisor:core;

import kcenon.common;

// ============================================================================
// Capabilities
// ============================================================================

export namespace resource_supervisor::core {

using ::resource_supervisor::core::named_resource;
using ::resource_supervisor::core::health_checkable;
using ::resource_supervisor::core::recoverable;
using ::resource_supervisor::core::monitorable;
using ::resource_supervisor::core::supervised_resource;
using ::resource_supervisor::core::pool_snapshot;

} // namespace resource_supervisor::core

// ============================================================================
// Workers and Configuration
// ============================================================================

export namespace resource_supervisor::core {

using ::resource_supervisor::core::periodic_worker;
using ::resource_supervisor::core::stop_signal;
using ::resource_supervisor::core::supervisor_dependencies;

using ::resource_supervisor::core::settings_map;
using ::resource_supervisor::core::health_check_config;
using ::resource_supervisor::core::retry_config;
using ::resource_supervisor::core::monitor_config;
using ::resource_supervisor::core::auto_reconnect_config;
using ::resource_supervisor::core::leak_detection_config;
using ::resource_supervisor::core::slow_query_config;
using ::resource_supervisor::core::logging_config;
using ::resource_supervisor::core::supervisor_config;

} // namespace resource_supervisor::core

export namespace resource_supervisor::error_codes {

using ::resource_supervisor::error_codes::invalid_configuration;
using ::resource_supervisor::error_codes::invalid_setting_value;
using ::resource_supervisor::error_codes::worker_already_started;
using ::resource_supervisor::error_codes::worker_stopped;
using ::resource_supervisor::error_codes::executor_rejected;
using ::resource_supervisor::error_codes::null_target;
using ::resource_supervisor::error_codes::invalid_interval;
using ::resource_supervisor::error_codes::invalid_failure_threshold;
using ::resource_supervisor::error_codes::retry_exhausted;
using ::resource_supervisor::error_codes::retry_cancelled;
using ::resource_supervisor::error_codes::invalid_thresholds;

} // namespace resource_supervisor::error_codes

// ============================================================================
// Logging
// ============================================================================

export namespace resource_supervisor::logging {

using ::resource_supervisor::logging::console_logger;
using ::resource_supervisor::logging::parse_log_level;

} // namespace resource_supervisor::logging

// ============================================================================
// Supervisor Group
// ============================================================================

export namespace resource_supervisor {

using ::resource_supervisor::group_state;
using ::resource_supervisor::supervisor_group;
using ::resource_supervisor::to_string;

} // namespace resource_supervisor
