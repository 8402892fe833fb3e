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

#include <kcenon/resource_supervisor/resilience/auto_reconnector.h>
#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/logging/log_helpers.h>

namespace resource_supervisor::resilience
{

using kcenon::common::interfaces::log_level;

namespace
{

/**
 * @brief Clears the in-flight flag when the attempt ends
 */
class in_flight_guard
{
public:
	explicit in_flight_guard(std::atomic<bool>& flag)
		: flag_(flag)
	{
	}

	~in_flight_guard() { flag_.store(false); }

	in_flight_guard(const in_flight_guard&) = delete;
	in_flight_guard& operator=(const in_flight_guard&) = delete;

private:
	std::atomic<bool>& flag_;
};

} // namespace

const char* to_string(reconnect_outcome outcome) noexcept
{
	switch (outcome)
	{
	case reconnect_outcome::in_flight:
		return "in_flight";
	case reconnect_outcome::connected:
		return "connected";
	case reconnect_outcome::exhausted:
		return "exhausted";
	case reconnect_outcome::reconnected:
		return "reconnected";
	case reconnect_outcome::failed:
		return "failed";
	}
	return "unknown";
}

kcenon::common::Result<std::unique_ptr<auto_reconnector>> auto_reconnector::create(
	core::recoverable* target,
	auto_reconnect_options options,
	core::supervisor_dependencies deps)
{
	if (!target)
	{
		return kcenon::common::error_info{
			error_codes::null_target, "Reconnect target is null", "auto_reconnector"
		};
	}

	if (options.interval.count() <= 0)
	{
		return kcenon::common::error_info{
			error_codes::invalid_interval,
			"Auto-reconnect interval must be greater than 0",
			"auto_reconnector"
		};
	}

	return std::make_unique<auto_reconnector>(
		construction_key{}, target, options, deps.resolved("auto_reconnector"));
}

auto_reconnector::auto_reconnector(construction_key,
								   core::recoverable* target,
								   auto_reconnect_options options,
								   core::supervisor_dependencies deps)
	: target_(target)
	, options_(options)
	, deps_(std::move(deps))
	, name_(target->name())
	, worker_("auto_reconnector[" + name_ + "]", options_.interval,
			  [this] { check_now(); }, deps_.logger, deps_.executor)
{
}

auto_reconnector::~auto_reconnector()
{
	stop();
}

kcenon::common::VoidResult auto_reconnector::start()
{
	return worker_.start();
}

kcenon::common::VoidResult auto_reconnector::start(kcenon::thread::cancellation_token token)
{
	return worker_.start(std::move(token));
}

void auto_reconnector::stop()
{
	worker_.stop();
}

reconnect_outcome auto_reconnector::check_now()
{
	if (reconnecting_.load())
	{
		return reconnect_outcome::in_flight;
	}

	if (target_->is_connected())
	{
		std::lock_guard<std::mutex> lock(mutex_);
		attempts_ = 0;
		exhaustion_logged_ = false;
		return reconnect_outcome::connected;
	}

	bool expected = false;
	if (!reconnecting_.compare_exchange_strong(expected, true))
	{
		return reconnect_outcome::in_flight;
	}
	in_flight_guard guard(reconnecting_);

	// Cap is checked while holding the in-flight flag
	int64_t current = 0;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		current = attempts_;

		if (options_.max_attempts > 0 && current >= static_cast<int64_t>(options_.max_attempts))
		{
			if (!exhaustion_logged_)
			{
				exhaustion_logged_ = true;
				logging::write_log(deps_.logger, log_level::error,
								   "Giving up reconnecting " + name_ + " after "
									   + std::to_string(current) + " failed attempts");
			}
			return reconnect_outcome::exhausted;
		}
	}

	logging::write_log(deps_.logger, log_level::info,
					   "Attempting to reconnect " + name_ + " (attempt "
						   + std::to_string(current + 1) + ")");

	deps_.recorder->inc_connect_attempt();
	if (current > 0)
	{
		deps_.recorder->inc_connect_retry();
	}

	auto result = target_->reconnect();

	std::lock_guard<std::mutex> lock(mutex_);
	if (result.is_err())
	{
		attempts_++;
		deps_.recorder->inc_connect_failure();
		logging::write_log(deps_.logger, log_level::warning,
						   "Reconnection attempt " + std::to_string(attempts_) + " failed for "
							   + name_ + ": " + result.error().message);
		return reconnect_outcome::failed;
	}

	attempts_ = 0;
	deps_.recorder->inc_connect_success();
	logging::write_log(deps_.logger, log_level::info, "Successfully reconnected " + name_);
	return reconnect_outcome::reconnected;
}

int64_t auto_reconnector::get_attempts() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return attempts_;
}

} // namespace resource_supervisor::resilience
