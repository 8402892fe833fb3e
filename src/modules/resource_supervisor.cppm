// BSD 3-Clause License
// Copyright (c) 2025, kcenon
// See the LICENSE file in the project root for full license information.

/**
 * @file resource_supervisor.cppm
 * @brief Primary C++20 module for resource_supervisor.
 *
 * Aggregates all module partitions to provide a single import point.
 *
 * Usage:
 * @code
 * import kcenon.resource_supervisor;
 *
 * using namespace resource_supervisor;
 *
 * supervisor_group group(&my_resource, core::supervisor_config::default_config());
 * if (auto result = group.start(); result.is_err()) {
 *     return 1;
 * }
 * @endcode
 *
 * Module Structure:
 * - kcenon.resource_supervisor:core - Capabilities, configuration, group
 * - kcenon.resource_supervisor:metrics - Recorder interface and registry
 * - kcenon.resource_supervisor:monitoring - Pool, leak and query monitors
 * - kcenon.resource_supervisor:resilience - Health checks and reconnection
 *
 * Dependencies:
 * - kcenon.common (Tier 0) - Result<T>, ILogger, IExecutor
 * - kcenon.thread (Tier 1) - cancellation_token
 */

export module kcenon.resource_supervisor;

import kcenon.common;

export import :core;
export import :metrics;
export import :monitoring;
export import :resilience;

export namespace resource_supervisor {

/**
 * @brief Version information for resource_supervisor module.
 */
struct module_version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;
    static constexpr const char* string = "0.1.0";
    static constexpr const char* module_name = "kcenon.resource_supervisor";
};

} // namespace resource_supervisor
