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

#include <kcenon/resource_supervisor/supervisor_group.h>
#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/logging/console_logger.h>
#include <kcenon/resource_supervisor/logging/log_helpers.h>

namespace resource_supervisor
{

using kcenon::common::interfaces::log_level;

namespace
{

std::shared_ptr<metrics::metrics_registry> registry_for(const core::supervisor_dependencies& deps,
														 const core::supervisor_config& config)
{
	if (deps.recorder)
	{
		return nullptr;
	}
	return std::make_shared<metrics::metrics_registry>(config.metrics);
}

core::supervisor_dependencies group_dependencies(core::supervisor_dependencies deps,
												 const core::supervisor_config& config,
												 const std::shared_ptr<metrics::metrics_registry>& registry)
{
	if (!deps.logger)
	{
		auto level = logging::parse_log_level(config.logging.level);
		deps.logger = logging::create_console_logger(
			config.name, level.is_ok() ? level.value() : log_level::info);
	}
	if (!deps.recorder)
	{
		deps.recorder = registry;
	}
	return deps.resolved(config.name);
}

std::string join(const std::vector<std::string>& parts)
{
	std::string joined;
	for (const auto& part : parts)
	{
		if (!joined.empty())
		{
			joined += "; ";
		}
		joined += part;
	}
	return joined;
}

template <typename Supervisor>
kcenon::common::VoidResult adopt(kcenon::common::Result<std::unique_ptr<Supervisor>> created,
								 std::unique_ptr<Supervisor>& slot,
								 const kcenon::thread::cancellation_token& token)
{
	if (created.is_err())
	{
		return created.error();
	}
	slot = std::move(created.unwrap());
	return slot->start(token);
}

} // namespace

const char* to_string(group_state state) noexcept
{
	switch (state)
	{
	case group_state::stopped:
		return "stopped";
	case group_state::starting:
		return "starting";
	case group_state::running:
		return "running";
	case group_state::stopping:
		return "stopping";
	}
	return "unknown";
}

supervisor_group::supervisor_group(core::supervised_resource* resource,
								   core::supervisor_config config,
								   core::supervisor_dependencies deps)
	: resource_(resource)
	, config_(std::move(config))
	, registry_(registry_for(deps, config_))
	, deps_(group_dependencies(std::move(deps), config_, registry_))
	, query_monitor_(config_.to_query_monitor_options(), deps_)
	, token_(kcenon::thread::cancellation_token::create())
{
}

supervisor_group::~supervisor_group()
{
	stop();
}

kcenon::common::VoidResult supervisor_group::start()
{
	std::lock_guard<std::mutex> lock(lifecycle_mutex_);

	if (state_ != group_state::stopped)
	{
		return kcenon::common::error_info{
			error_codes::worker_already_started,
			"Supervisor group for " + config_.name + " is already started",
			"supervisor_group"
		};
	}

	if (!resource_)
	{
		return kcenon::common::error_info{
			error_codes::null_target, "Supervisor group resource is null", "supervisor_group"
		};
	}

	auto errors = config_.validation_errors();
	if (!errors.empty())
	{
		return kcenon::common::error_info{
			error_codes::invalid_configuration,
			"Invalid supervisor configuration: " + join(errors),
			"supervisor_group"
		};
	}

	state_ = group_state::starting;

	// A cancelled token cannot be reused
	if (token_.is_cancelled())
	{
		token_ = kcenon::thread::cancellation_token::create();
	}

	auto result = start_supervisors();
	if (result.is_err())
	{
		token_.cancel();
		stop_supervisors();
		state_ = group_state::stopped;
		logging::write_log(deps_.logger, log_level::error,
						   "Failed to start supervisors for " + config_.name + ": "
							   + result.error().message);
		return result;
	}

	state_ = group_state::running;
	logging::write_log(deps_.logger, log_level::info,
					   "Supervisors started for " + config_.name);
	return kcenon::common::ok();
}

kcenon::common::VoidResult supervisor_group::start_supervisors()
{
	if (config_.health_check.enabled)
	{
		auto result = adopt(resilience::health_checker::create(
								resource_, config_.to_health_check_options(), deps_, resource_),
							health_checker_, token_);
		if (result.is_err())
		{
			return result;
		}
	}

	if (config_.auto_reconnect.enabled)
	{
		auto result = adopt(resilience::auto_reconnector::create(
								resource_, config_.to_auto_reconnect_options(), deps_),
							auto_reconnector_, token_);
		if (result.is_err())
		{
			return result;
		}
	}

	if (config_.monitor.enabled)
	{
		auto result = adopt(monitoring::pool_monitor::create(
								resource_, config_.to_pool_monitor_options(), deps_),
							pool_monitor_, token_);
		if (result.is_err())
		{
			return result;
		}
	}

	if (config_.leak_detection.enabled)
	{
		auto result = adopt(monitoring::leak_detector::create(
								resource_, config_.to_leak_detector_options(), deps_),
							leak_detector_, token_);
		if (result.is_err())
		{
			return result;
		}
	}

	return kcenon::common::ok();
}

void supervisor_group::stop()
{
	std::lock_guard<std::mutex> lock(lifecycle_mutex_);

	token_.cancel();

	if (state_ != group_state::running)
	{
		return;
	}

	state_ = group_state::stopping;
	stop_supervisors();
	state_ = group_state::stopped;

	logging::write_log(deps_.logger, log_level::info,
					   "Supervisors stopped for " + config_.name);
}

void supervisor_group::stop_supervisors()
{
	// Reverse of start order
	if (leak_detector_)
	{
		leak_detector_->stop();
		leak_detector_.reset();
	}
	if (pool_monitor_)
	{
		pool_monitor_->stop();
		pool_monitor_.reset();
	}
	if (auto_reconnector_)
	{
		auto_reconnector_->stop();
		auto_reconnector_.reset();
	}
	if (health_checker_)
	{
		health_checker_->stop();
		health_checker_.reset();
	}
}

kcenon::common::VoidResult supervisor_group::connect(const resilience::connect_function& open)
{
	if (!open)
	{
		return kcenon::common::error_info{
			error_codes::invalid_configuration, "Connect function is empty", "supervisor_group"
		};
	}

	if (!config_.retry.enabled)
	{
		return open();
	}

	kcenon::thread::cancellation_token token = [this] {
		std::lock_guard<std::mutex> lock(lifecycle_mutex_);
		if (token_.is_cancelled())
		{
			token_ = kcenon::thread::cancellation_token::create();
		}
		return token_;
	}();

	return resilience::connect_with_retry(open, config_.to_backoff_policy(), deps_,
										  config_.name, token);
}

std::map<std::string, std::string> supervisor_group::status_info() const
{
	std::lock_guard<std::mutex> lock(lifecycle_mutex_);

	std::map<std::string, std::string> info;
	info["state"] = to_string(state_.load());
	info["running"] = state_.load() == group_state::running ? "true" : "false";

	info["healthy"] = (!health_checker_ || health_checker_->is_healthy()) ? "true" : "false";
	info["consecutive_failures"]
		= std::to_string(health_checker_ ? health_checker_->consecutive_failures() : 0);
	info["reconnect_attempts"]
		= std::to_string(auto_reconnector_ ? auto_reconnector_->get_attempts() : 0);
	info["alerts_emitted"]
		= std::to_string(pool_monitor_ ? pool_monitor_->alerts_emitted() : 0);
	info["leak_suspicions"]
		= std::to_string(leak_detector_ ? leak_detector_->suspicions_reported() : 0);

	return info;
}

} // namespace resource_supervisor
