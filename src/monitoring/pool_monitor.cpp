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

#include <kcenon/resource_supervisor/monitoring/pool_monitor.h>
#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/logging/log_helpers.h>

#include <sstream>

namespace resource_supervisor::monitoring
{

using kcenon::common::interfaces::log_level;

bool pool_thresholds::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> pool_thresholds::validation_errors() const
{
	std::vector<std::string> errors;

	if (!(usage_percentage > 0.0 && usage_percentage <= 1.0))
	{
		errors.push_back("Usage threshold must be in (0, 1]");
	}

	if (wait_duration.count() <= 0)
	{
		errors.push_back("Wait duration threshold must be greater than 0");
	}

	if (wait_count <= 0)
	{
		errors.push_back("Wait count threshold must be greater than 0");
	}

	return errors;
}

const char* to_string(alert_severity severity) noexcept
{
	switch (severity)
	{
	case alert_severity::none:
		return "";
	case alert_severity::warning:
		return "warning";
	case alert_severity::critical:
		return "critical";
	}
	return "";
}

std::string pool_alert::describe() const
{
	std::ostringstream oss;
	oss << "Connection pool alert [" << to_string(severity) << "] for " << resource << ": ";
	for (size_t i = 0; i < reasons.size(); ++i)
	{
		if (i > 0)
		{
			oss << ", ";
		}
		oss << reasons[i];
	}
	oss << " (" << logging::format_snapshot(snapshot) << ")";
	return oss.str();
}

kcenon::common::Result<std::unique_ptr<pool_monitor>> pool_monitor::create(
	core::monitorable* target,
	pool_monitor_options options,
	core::supervisor_dependencies deps)
{
	if (!target)
	{
		return kcenon::common::error_info{
			error_codes::null_target, "Pool monitor target is null", "pool_monitor"
		};
	}

	if (options.interval.count() <= 0)
	{
		return kcenon::common::error_info{
			error_codes::invalid_interval,
			"Pool monitor interval must be greater than 0",
			"pool_monitor"
		};
	}

	auto errors = options.thresholds.validation_errors();
	if (!errors.empty())
	{
		return kcenon::common::error_info{
			error_codes::invalid_thresholds, errors.front(), "pool_monitor"
		};
	}

	return std::make_unique<pool_monitor>(
		construction_key{}, target, std::move(options), deps.resolved("pool_monitor"));
}

pool_monitor::pool_monitor(construction_key,
						   core::monitorable* target,
						   pool_monitor_options options,
						   core::supervisor_dependencies deps)
	: target_(target)
	, options_(std::move(options))
	, deps_(std::move(deps))
	, name_(target->name())
	, worker_("pool_monitor[" + name_ + "]", options_.interval,
			  [this] { check_now(); }, deps_.logger, deps_.executor)
{
}

pool_monitor::~pool_monitor()
{
	stop();
}

kcenon::common::VoidResult pool_monitor::start()
{
	return worker_.start();
}

kcenon::common::VoidResult pool_monitor::start(kcenon::thread::cancellation_token token)
{
	return worker_.start(std::move(token));
}

void pool_monitor::stop()
{
	worker_.stop();
}

std::optional<pool_alert> pool_monitor::check_now()
{
	std::lock_guard<std::mutex> cycle(cycle_mutex_);

	const auto snapshot = target_->get_stats();
	deps_.recorder->record_pool_stats(snapshot);
	return evaluate(snapshot, std::chrono::steady_clock::now());
}

pool_assessment pool_monitor::assess(const core::pool_snapshot& snapshot,
									 const pool_thresholds& thresholds)
{
	pool_assessment assessment;
	bool critical = false;

	if (snapshot.max_open > 0)
	{
		const double usage = snapshot.usage_ratio();
		if (usage >= thresholds.usage_percentage)
		{
			assessment.reasons.push_back("high pool usage");
			critical = critical || usage >= pool_thresholds::critical_usage;
		}
	}

	if (snapshot.wait_duration >= thresholds.wait_duration)
	{
		assessment.reasons.push_back("high wait duration");
		critical = critical
				   || snapshot.wait_duration
						  > thresholds.wait_duration * pool_thresholds::critical_wait_duration_factor;
	}

	if (snapshot.wait_count >= thresholds.wait_count)
	{
		assessment.reasons.push_back("high wait count");
		critical = critical
				   || snapshot.wait_count
						  > thresholds.wait_count * pool_thresholds::critical_wait_count_factor;
	}

	if (assessment.fired())
	{
		assessment.severity = critical ? alert_severity::critical : alert_severity::warning;
	}
	return assessment;
}

std::optional<pool_alert> pool_monitor::evaluate(const core::pool_snapshot& snapshot,
												 std::chrono::steady_clock::time_point now)
{
	auto assessment = assess(snapshot, options_.thresholds);

	alert_handler handler;
	{
		std::lock_guard<std::mutex> lock(mutex_);

		if (!assessment.fired())
		{
			last_severity_ = alert_severity::none;
			return std::nullopt;
		}

		auto cooldown = options_.alert_cooldown;
		if (assessment.severity == alert_severity::critical
			&& last_severity_ != alert_severity::critical)
		{
			cooldown = options_.critical_cooldown;
		}

		const bool should_alert = !last_alert_time_ || (now - *last_alert_time_) > cooldown;
		if (!should_alert)
		{
			alerts_suppressed_.fetch_add(1);
			return std::nullopt;
		}

		last_alert_time_ = now;
		last_severity_ = assessment.severity;
		handler = handler_;
	}

	pool_alert alert;
	alert.resource = name_;
	alert.severity = assessment.severity;
	alert.reasons = std::move(assessment.reasons);
	alert.snapshot = snapshot;
	alert.time = std::chrono::system_clock::now();

	alerts_emitted_.fetch_add(1);
	logging::write_log(deps_.logger, log_level::warning, alert.describe());

	if (handler)
	{
		handler(alert);
	}

	return alert;
}

void pool_monitor::set_alert_handler(alert_handler handler)
{
	std::lock_guard<std::mutex> lock(mutex_);
	handler_ = std::move(handler);
}

alert_severity pool_monitor::last_severity() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return last_severity_;
}

} // namespace resource_supervisor::monitoring
