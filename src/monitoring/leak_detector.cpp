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

#include <kcenon/resource_supervisor/monitoring/leak_detector.h>
#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/logging/log_helpers.h>

namespace resource_supervisor::monitoring
{

using kcenon::common::interfaces::log_level;

const char* to_string(leak_kind kind) noexcept
{
	switch (kind)
	{
	case leak_kind::pool_saturated:
		return "pool_saturated";
	case leak_kind::long_wait:
		return "long_wait";
	}
	return "unknown";
}

kcenon::common::Result<std::unique_ptr<leak_detector>> leak_detector::create(
	core::monitorable* target,
	leak_detector_options options,
	core::supervisor_dependencies deps)
{
	if (!target)
	{
		return kcenon::common::error_info{
			error_codes::null_target, "Leak detector target is null", "leak_detector"
		};
	}

	if (options.wait_threshold.count() <= 0)
	{
		return kcenon::common::error_info{
			error_codes::invalid_thresholds,
			"Leak detection wait threshold must be greater than 0",
			"leak_detector"
		};
	}

	return std::make_unique<leak_detector>(
		construction_key{}, target, options, deps.resolved("leak_detector"));
}

leak_detector::leak_detector(construction_key,
							 core::monitorable* target,
							 leak_detector_options options,
							 core::supervisor_dependencies deps)
	: target_(target)
	, options_(options)
	, deps_(std::move(deps))
	, name_(target->name())
	, worker_("leak_detector[" + name_ + "]",
			  std::chrono::duration_cast<std::chrono::milliseconds>(detection_interval),
			  [this] { check_now(); }, deps_.logger, deps_.executor)
{
}

leak_detector::~leak_detector()
{
	stop();
}

kcenon::common::VoidResult leak_detector::start()
{
	return worker_.start();
}

kcenon::common::VoidResult leak_detector::start(kcenon::thread::cancellation_token token)
{
	return worker_.start(std::move(token));
}

void leak_detector::stop()
{
	worker_.stop();
}

std::vector<leak_suspicion> leak_detector::inspect(const std::string& resource,
												   const core::pool_snapshot& snapshot,
												   std::chrono::nanoseconds wait_threshold)
{
	std::vector<leak_suspicion> suspicions;
	if (snapshot.in_use <= 0)
	{
		return suspicions;
	}

	if (snapshot.max_open > 0 && snapshot.usage_ratio() >= saturation_usage
		&& snapshot.fully_checked_out())
	{
		suspicions.push_back({ leak_kind::pool_saturated,
							   "Potential connection leak detected for " + resource
								   + ": all connections (" + std::to_string(snapshot.open) + "/"
								   + std::to_string(snapshot.max_open) + ") are in use",
							   snapshot });
	}

	if (snapshot.wait_duration > wait_threshold)
	{
		suspicions.push_back({ leak_kind::long_wait,
							   "Long connection wait detected for " + resource + ": "
								   + logging::format_duration(snapshot.wait_duration)
								   + " (threshold: " + logging::format_duration(wait_threshold)
								   + "). Possible connection leak.",
							   snapshot });
	}

	return suspicions;
}

std::vector<leak_suspicion> leak_detector::check_now()
{
	auto suspicions = inspect(name_, target_->get_stats(), options_.wait_threshold);
	if (suspicions.empty())
	{
		return suspicions;
	}

	suspicion_handler handler;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		handler = handler_;
	}

	for (const auto& suspicion : suspicions)
	{
		suspicions_reported_.fetch_add(1);
		logging::write_log(deps_.logger, log_level::warning, suspicion.message);
		if (handler)
		{
			handler(suspicion);
		}
	}

	return suspicions;
}

void leak_detector::set_suspicion_handler(suspicion_handler handler)
{
	std::lock_guard<std::mutex> lock(mutex_);
	handler_ = std::move(handler);
}

} // namespace resource_supervisor::monitoring
