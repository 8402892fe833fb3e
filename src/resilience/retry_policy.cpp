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

#include <kcenon/resource_supervisor/resilience/retry_policy.h>
#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/core/stop_signal.h>
#include <kcenon/resource_supervisor/logging/log_helpers.h>

#include <algorithm>
#include <cmath>

namespace resource_supervisor::resilience
{

using kcenon::common::interfaces::log_level;

std::chrono::milliseconds backoff_policy::delay_for(uint32_t attempt) const
{
	double delay_ms = initial_delay.count() * std::pow(multiplier, attempt);
	delay_ms = std::min(delay_ms, static_cast<double>(max_delay.count()));
	return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

bool backoff_policy::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> backoff_policy::validation_errors() const
{
	std::vector<std::string> errors;

	if (max_attempts == 0)
	{
		errors.push_back("Retry max_attempts must be at least 1");
	}

	if (initial_delay.count() < 0)
	{
		errors.push_back("Retry initial_delay cannot be negative");
	}

	if (initial_delay > max_delay)
	{
		errors.push_back("Retry initial_delay cannot exceed max_delay");
	}

	if (multiplier < 1.0)
	{
		errors.push_back("Retry multiplier must be at least 1.0");
	}

	return errors;
}

kcenon::common::VoidResult connect_with_retry(
	const connect_function& connect,
	const backoff_policy& policy,
	const core::supervisor_dependencies& deps,
	const std::string& name,
	std::optional<kcenon::thread::cancellation_token> token)
{
	if (!connect)
	{
		return kcenon::common::error_info{
			error_codes::invalid_configuration, "No connect function for " + name, "retry_policy"
		};
	}

	if (!policy.validate())
	{
		return kcenon::common::error_info{
			error_codes::invalid_configuration,
			"Invalid retry policy for " + name + ": " + policy.validation_errors().front(),
			"retry_policy"
		};
	}

	const auto resolved = deps.resolved("retry_policy");
	auto cancelled = token ? core::stop_signal::linked_to(*token)
						   : std::make_shared<core::stop_signal>();
	std::string last_error;

	for (uint32_t attempt = 0; attempt < policy.max_attempts; ++attempt)
	{
		resolved.recorder->inc_connect_attempt();
		if (attempt > 0)
		{
			resolved.recorder->inc_connect_retry();
		}

		auto result = connect();
		if (result.is_ok())
		{
			resolved.recorder->inc_connect_success();
			if (attempt > 0)
			{
				logging::write_log(resolved.logger, log_level::info,
								   "Connected to " + name + " after "
									   + std::to_string(attempt + 1) + " attempts");
			}
			return kcenon::common::ok();
		}

		resolved.recorder->inc_connect_failure();
		last_error = result.error().message;
		logging::write_log(resolved.logger, log_level::warning,
						   "Connection attempt " + std::to_string(attempt + 1) + "/"
							   + std::to_string(policy.max_attempts) + " failed for " + name
							   + ": " + last_error);

		if (attempt + 1 >= policy.max_attempts)
		{
			break;
		}

		const auto delay = policy.delay_for(attempt);
		logging::write_log(resolved.logger, log_level::info,
						   "Retrying connection to " + name + " in "
							   + logging::format_duration(delay));

		if (!cancelled->wait_for(delay))
		{
			return kcenon::common::error_info{
				error_codes::retry_cancelled,
				"Connection retry for " + name + " cancelled",
				"retry_policy"
			};
		}
	}

	return kcenon::common::error_info{
		error_codes::retry_exhausted,
		"Failed to connect to " + name + " after " + std::to_string(policy.max_attempts)
			+ " attempts: " + last_error,
		"retry_policy"
	};
}

} // namespace resource_supervisor::resilience
