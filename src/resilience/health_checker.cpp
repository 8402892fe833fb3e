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

#include <kcenon/resource_supervisor/resilience/health_checker.h>
#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/logging/log_helpers.h>

namespace resource_supervisor::resilience
{

using kcenon::common::interfaces::log_level;

kcenon::common::Result<std::unique_ptr<health_checker>> health_checker::create(
	core::health_checkable* target,
	health_check_options options,
	core::supervisor_dependencies deps,
	core::recoverable* recovery)
{
	if (!target)
	{
		return kcenon::common::error_info{
			error_codes::null_target, "Health check target is null", "health_checker"
		};
	}

	if (options.interval.count() <= 0)
	{
		return kcenon::common::error_info{
			error_codes::invalid_interval,
			"Health check interval must be greater than 0",
			"health_checker"
		};
	}

	if (options.max_failures == 0)
	{
		return kcenon::common::error_info{
			error_codes::invalid_failure_threshold,
			"Health check max_failures must be at least 1",
			"health_checker"
		};
	}

	if (!recovery)
	{
		recovery = dynamic_cast<core::recoverable*>(target);
	}

	return std::make_unique<health_checker>(
		construction_key{}, target, recovery, std::move(options),
		deps.resolved("health_checker"));
}

health_checker::health_checker(construction_key,
							   core::health_checkable* target,
							   core::recoverable* recovery,
							   health_check_options options,
							   core::supervisor_dependencies deps)
	: target_(target)
	, recovery_(recovery)
	, options_(std::move(options))
	, deps_(std::move(deps))
	, name_(target->name())
	, worker_("health_checker[" + name_ + "]", options_.interval,
			  [this] { check_now(); }, deps_.logger, deps_.executor)
{
	state_.last_check_time = std::chrono::system_clock::now();
}

health_checker::~health_checker()
{
	stop();
}

kcenon::common::VoidResult health_checker::start()
{
	return worker_.start();
}

kcenon::common::VoidResult health_checker::start(kcenon::thread::cancellation_token token)
{
	return worker_.start(std::move(token));
}

void health_checker::stop()
{
	worker_.stop();
}

health_state health_checker::check_now()
{
	std::lock_guard<std::mutex> cycle(cycle_mutex_);

	auto result = target_->check_health();
	deps_.recorder->record_health_check(result.is_ok());

	std::unique_lock<std::mutex> lock(mutex_);
	state_.last_check_time = std::chrono::system_clock::now();

	if (result.is_err())
	{
		state_.consecutive_failures++;
		if (state_.is_healthy)
		{
			logging::write_log(deps_.logger, log_level::error,
							   "Health check failed for " + name_ + ": "
								   + result.error().message);
		}
		state_.is_healthy = false;

		if (recovery_ && !recovery_attempted_
			&& state_.consecutive_failures >= options_.max_failures)
		{
			attempt_recovery(lock);
		}
	}
	else
	{
		if (!state_.is_healthy)
		{
			logging::write_log(deps_.logger, log_level::info,
							   "Health check recovered for " + name_);
		}
		state_.is_healthy = true;
		state_.consecutive_failures = 0;
		recovery_attempted_ = false;
	}

	return state_;
}

void health_checker::attempt_recovery(std::unique_lock<std::mutex>& lock)
{
	recovery_attempted_ = true;
	const auto failures = state_.consecutive_failures;

	// reconnect() may block on network I/O; readers must not wait on it.
	lock.unlock();

	logging::write_log(deps_.logger, log_level::warning,
					   std::to_string(failures) + " consecutive health check failures for "
						   + name_ + ", attempting recovery");

	deps_.recorder->inc_connect_attempt();
	auto result = recovery_->reconnect();
	recovery_attempts_.fetch_add(1);

	if (result.is_ok())
	{
		deps_.recorder->inc_connect_success();
	}
	else
	{
		deps_.recorder->inc_connect_failure();
	}

	lock.lock();

	if (result.is_ok())
	{
		state_.consecutive_failures = 0;
		state_.is_healthy = true;
		recovery_attempted_ = false;
		logging::write_log(deps_.logger, log_level::info,
						   "Recovered " + name_ + " after " + std::to_string(failures)
							   + " consecutive health check failures");
	}
	else
	{
		logging::write_log(deps_.logger, log_level::error,
						   "Recovery of " + name_ + " failed: " + result.error().message);
	}
}

bool health_checker::is_healthy() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return state_.is_healthy;
}

uint32_t health_checker::consecutive_failures() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return state_.consecutive_failures;
}

health_state health_checker::get_state() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return state_;
}

} // namespace resource_supervisor::resilience
