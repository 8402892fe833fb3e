// BSD 3-Clause License
// Copyright (c) 2025, kcenon
// See the LICENSE file in the project root for full license information.

/**
 * @file resource_supervisor-resilience.cppm
 * @brief C++20 module partition for resource_supervisor resilience.
 *
 * This module partition exports:
 * - health_checker and its state snapshot
 * - auto_reconnector and its outcomes
 * - backoff_policy and connect_with_retry
 *
 * Part of the kcenon.resource_supervisor module.
 */

module;

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/resource_supervisor/resilience/auto_reconnector.h"
#include "kcenon/resource_supervisor/resilience/health_checker.h"
#include "kcenon/resource_supervisor/resilience/retry_policy.h"

export module kcenon.resource_supervisor:resilience;

import kcenon.common;

// ============================================================================
// Health Checking
// ============================================================================

export namespace resource_supervisor::resilience {

using ::resource_supervisor::resilience::health_check_options;
using ::resource_supervisor::resilience::health_state;
using ::resource_supervisor::resilience::health_checker;

} // namespace resource_supervisor::resilience

// ============================================================================
// Reconnection
// ============================================================================

export namespace resource_supervisor::resilience {

using ::resource_supervisor::resilience::auto_reconnect_options;
using ::resource_supervisor::resilience::reconnect_outcome;
using ::resource_supervisor::resilience::auto_reconnector;

// Re-export to_string for reconnect_outcome
using ::resource_supervisor::resilience::to_string;

using ::resource_supervisor::resilience::backoff_policy;
using ::resource_supervisor::resilience::connect_function;
using ::resource_supervisor::resilience::connect_with_retry;

} // namespace resource_supervisor::resilience
