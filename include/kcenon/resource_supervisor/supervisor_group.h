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
 * @file supervisor_group.h
 * @brief Lifecycle owner for all supervisors of one resource
 *
 * A plugin that manages a pooled resource constructs one supervisor_group
 * per resource. The group turns a supervisor_config into running
 * supervisors, shares one logger, recorder and executor between them, and
 * owns the shutdown token they are linked to.
 *
 * The group provides:
 * - Configuration validation before any worker exists
 * - Start of every enabled supervisor with a shared cancellation token
 * - Reverse-order, idempotent shutdown
 * - Startup connection retry driven by the retry section
 * - A status map for diagnostics endpoints
 */

#pragma once

#include "core/capabilities.h"
#include "core/supervisor_config.h"
#include "core/supervisor_dependencies.h"
#include "metrics/metrics_registry.h"
#include "monitoring/leak_detector.h"
#include "monitoring/pool_monitor.h"
#include "monitoring/query_monitor.h"
#include "resilience/auto_reconnector.h"
#include "resilience/health_checker.h"
#include "resilience/retry_policy.h"

#include <kcenon/common/patterns/result.h>
#include <kcenon/thread/core/cancellation_token.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace resource_supervisor
{

/**
 * @enum group_state
 * @brief Lifecycle state of a supervisor group
 */
enum class group_state
{
	stopped,  ///< No supervisor is running
	starting, ///< Supervisors are being created
	running,  ///< Enabled supervisors are running
	stopping  ///< Supervisors are being stopped
};

/**
 * @brief Convert group state to string
 */
[[nodiscard]] const char* to_string(group_state state) noexcept;

/**
 * @class supervisor_group
 * @brief Creates, starts and stops the supervisors of one resource
 *
 * Thread Safety:
 * - start() and stop() are serialized and may be called from any thread
 * - stop() cancels the group token first, so connect() sleeps and worker
 *   waits end promptly
 *
 * Usage Example:
 * @code
 *   auto config = core::supervisor_config::from_settings(plugin_settings);
 *   resource_supervisor::supervisor_group group(&postgres_adapter, config.value());
 *
 *   auto connected = group.connect([&] { return postgres_adapter.open(); });
 *   if (connected.is_err()) { ... }
 *
 *   auto started = group.start();
 *   if (started.is_err()) { ... }
 *   ...
 *   group.stop();
 * @endcode
 */
class supervisor_group
{
public:
	/**
	 * @brief Construct a group
	 * @param resource Resource to supervise, must outlive the group
	 * @param config Supervisor settings
	 * @param deps Shared dependencies. A null logger becomes a console
	 *        logger at config.logging.level; a null recorder becomes a
	 *        metrics_registry built from config.metrics.
	 */
	supervisor_group(core::supervised_resource* resource,
					 core::supervisor_config config,
					 core::supervisor_dependencies deps = {});

	/**
	 * @brief Destructor - stops all supervisors
	 */
	~supervisor_group();

	supervisor_group(const supervisor_group&) = delete;
	supervisor_group& operator=(const supervisor_group&) = delete;
	supervisor_group(supervisor_group&&) = delete;
	supervisor_group& operator=(supervisor_group&&) = delete;

	/**
	 * @brief Validate the configuration and start every enabled supervisor
	 * @return ok() when all enabled supervisors are running. On error no
	 *         supervisor is left running.
	 */
	kcenon::common::VoidResult start();

	/**
	 * @brief Cancel the group token and stop supervisors in reverse order
	 *
	 * Repeated calls have no effect.
	 */
	void stop();

	/**
	 * @brief Open the resource, retrying with backoff when retry is enabled
	 * @param open Operation that opens the resource
	 * @return ok() on success, or the retry error
	 */
	kcenon::common::VoidResult connect(const resilience::connect_function& open);

	[[nodiscard]] group_state state() const noexcept { return state_.load(); }
	[[nodiscard]] bool is_running() const noexcept { return state_.load() == group_state::running; }
	[[nodiscard]] const core::supervisor_config& config() const noexcept { return config_; }
	[[nodiscard]] const core::supervisor_dependencies& dependencies() const noexcept { return deps_; }

	/**
	 * @brief Registry created for a null recorder, nullptr otherwise
	 */
	[[nodiscard]] std::shared_ptr<metrics::metrics_registry> registry() const noexcept { return registry_; }

	// Supervisors are null while stopped or when disabled in the config
	[[nodiscard]] resilience::health_checker* health() const noexcept { return health_checker_.get(); }
	[[nodiscard]] resilience::auto_reconnector* reconnector() const noexcept { return auto_reconnector_.get(); }
	[[nodiscard]] monitoring::pool_monitor* monitor() const noexcept { return pool_monitor_.get(); }
	[[nodiscard]] monitoring::leak_detector* leaks() const noexcept { return leak_detector_.get(); }

	/**
	 * @brief Query monitor configured from the slow_query section
	 */
	[[nodiscard]] monitoring::query_monitor& queries() noexcept { return query_monitor_; }

	/**
	 * @brief Diagnostics snapshot
	 * @return Map with keys: state, running, healthy, consecutive_failures,
	 *         reconnect_attempts, alerts_emitted, leak_suspicions
	 */
	[[nodiscard]] std::map<std::string, std::string> status_info() const;

private:
	kcenon::common::VoidResult start_supervisors();
	void stop_supervisors();

	core::supervised_resource* resource_;
	core::supervisor_config config_;
	std::shared_ptr<metrics::metrics_registry> registry_;
	core::supervisor_dependencies deps_;
	monitoring::query_monitor query_monitor_;

	mutable std::mutex lifecycle_mutex_;
	std::atomic<group_state> state_{ group_state::stopped };
	kcenon::thread::cancellation_token token_;

	std::unique_ptr<resilience::health_checker> health_checker_;
	std::unique_ptr<resilience::auto_reconnector> auto_reconnector_;
	std::unique_ptr<monitoring::pool_monitor> pool_monitor_;
	std::unique_ptr<monitoring::leak_detector> leak_detector_;
};

} // namespace resource_supervisor
