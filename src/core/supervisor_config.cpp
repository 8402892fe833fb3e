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

#include <kcenon/resource_supervisor/core/supervisor_config.h>
#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/logging/console_logger.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>

namespace resource_supervisor::core
{

namespace
{

constexpr const char* metrics_label_prefix = "metrics.label.";

std::string trimmed(const std::string& value)
{
	std::string s = value;
	s.erase(0, s.find_first_not_of(" \t\r\n"));
	s.erase(s.find_last_not_of(" \t\r\n") + 1);
	return s;
}

std::optional<bool> parse_bool(const std::string& value)
{
	std::string lowered = trimmed(value);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
				   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on")
	{
		return true;
	}
	if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off")
	{
		return false;
	}
	return std::nullopt;
}

template <typename Integer>
std::optional<Integer> parse_integer(const std::string& value)
{
	const std::string text = trimmed(value);
	Integer parsed{};
	auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
	if (ec != std::errc() || end != text.data() + text.size() || text.empty())
	{
		return std::nullopt;
	}
	return parsed;
}

std::optional<double> parse_double(const std::string& value)
{
	const std::string text = trimmed(value);
	if (text.empty())
	{
		return std::nullopt;
	}

	char* end = nullptr;
	double parsed = std::strtod(text.c_str(), &end);
	if (end != text.c_str() + text.size())
	{
		return std::nullopt;
	}
	return parsed;
}

kcenon::common::error_info invalid_value(const std::string& key, const std::string& value)
{
	return kcenon::common::error_info{
		error_codes::invalid_setting_value,
		"Invalid value '" + value + "' for setting " + key,
		"supervisor_config"
	};
}

template <typename T, typename Parser>
kcenon::common::VoidResult assign(T& field, const std::string& key, const std::string& value,
								  Parser parser)
{
	auto parsed = parser(value);
	if (!parsed)
	{
		return invalid_value(key, value);
	}
	field = *parsed;
	return kcenon::common::ok();
}

kcenon::common::VoidResult apply_setting(supervisor_config& config,
										 const std::string& key,
										 const std::string& value)
{
	const auto as_bool = parse_bool;
	const auto as_u32 = parse_integer<uint32_t>;
	const auto as_i64 = parse_integer<int64_t>;
	const auto as_double = parse_double;

	if (key == "name")
	{
		config.name = trimmed(value);
	}
	else if (key == "health_check.enabled")
	{
		return assign(config.health_check.enabled, key, value, as_bool);
	}
	else if (key == "health_check.interval_seconds")
	{
		return assign(config.health_check.interval_seconds, key, value, as_u32);
	}
	else if (key == "health_check.custom_query")
	{
		config.health_check.custom_query = trimmed(value);
	}
	else if (key == "health_check.max_failures")
	{
		return assign(config.health_check.max_failures, key, value, as_u32);
	}
	else if (key == "retry.enabled")
	{
		return assign(config.retry.enabled, key, value, as_bool);
	}
	else if (key == "retry.max_attempts")
	{
		return assign(config.retry.max_attempts, key, value, as_u32);
	}
	else if (key == "retry.initial_delay_seconds")
	{
		return assign(config.retry.initial_delay_seconds, key, value, as_u32);
	}
	else if (key == "retry.max_delay_seconds")
	{
		return assign(config.retry.max_delay_seconds, key, value, as_u32);
	}
	else if (key == "retry.multiplier")
	{
		return assign(config.retry.multiplier, key, value, as_double);
	}
	else if (key == "monitor.enabled")
	{
		return assign(config.monitor.enabled, key, value, as_bool);
	}
	else if (key == "monitor.interval_seconds")
	{
		return assign(config.monitor.interval_seconds, key, value, as_u32);
	}
	else if (key == "monitor.usage_threshold")
	{
		return assign(config.monitor.usage_threshold, key, value, as_double);
	}
	else if (key == "monitor.wait_threshold_seconds")
	{
		return assign(config.monitor.wait_threshold_seconds, key, value, as_u32);
	}
	else if (key == "monitor.wait_count_threshold")
	{
		return assign(config.monitor.wait_count_threshold, key, value, as_i64);
	}
	else if (key == "auto_reconnect.enabled")
	{
		return assign(config.auto_reconnect.enabled, key, value, as_bool);
	}
	else if (key == "auto_reconnect.interval_seconds")
	{
		return assign(config.auto_reconnect.interval_seconds, key, value, as_u32);
	}
	else if (key == "auto_reconnect.max_attempts")
	{
		return assign(config.auto_reconnect.max_attempts, key, value, as_u32);
	}
	else if (key == "leak_detection.enabled")
	{
		return assign(config.leak_detection.enabled, key, value, as_bool);
	}
	else if (key == "leak_detection.threshold_seconds")
	{
		return assign(config.leak_detection.threshold_seconds, key, value, as_u32);
	}
	else if (key == "slow_query.enabled")
	{
		return assign(config.slow_query.enabled, key, value, as_bool);
	}
	else if (key == "slow_query.threshold_ms")
	{
		return assign(config.slow_query.threshold_ms, key, value, as_u32);
	}
	else if (key == "logging.level")
	{
		config.logging.level = trimmed(value);
	}
	else if (key == "metrics.enabled")
	{
		return assign(config.metrics.enabled, key, value, as_bool);
	}
	else if (key == "metrics.namespace")
	{
		config.metrics.ns = trimmed(value);
	}
	else if (key == "metrics.subsystem")
	{
		config.metrics.subsystem = trimmed(value);
	}
	else if (key.rfind(metrics_label_prefix, 0) == 0)
	{
		config.metrics.labels[key.substr(std::char_traits<char>::length(metrics_label_prefix))]
			= trimmed(value);
	}

	return kcenon::common::ok();
}

} // namespace

supervisor_config supervisor_config::default_config()
{
	supervisor_config config;
	// All defaults are set in the struct definitions
	return config;
}

kcenon::common::Result<supervisor_config> supervisor_config::from_settings(
	const settings_map& settings)
{
	supervisor_config config = default_config();

	for (const auto& [raw_key, value] : settings)
	{
		auto result = apply_setting(config, trimmed(raw_key), value);
		if (result.is_err())
		{
			return result.error();
		}
	}

	return config;
}

bool supervisor_config::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> supervisor_config::validation_errors() const
{
	std::vector<std::string> errors;

	if (name.empty())
	{
		errors.push_back("Resource name cannot be empty");
	}

	if (health_check.enabled)
	{
		if (health_check.interval_seconds == 0)
		{
			errors.push_back("Health check interval must be greater than 0");
		}
		if (health_check.max_failures == 0)
		{
			errors.push_back("Health check max_failures must be at least 1");
		}
	}

	if (retry.enabled)
	{
		for (const auto& error : to_backoff_policy().validation_errors())
		{
			errors.push_back(error);
		}
	}

	if (monitor.enabled)
	{
		if (monitor.interval_seconds == 0)
		{
			errors.push_back("Monitor interval must be greater than 0");
		}
		for (const auto& error : to_pool_monitor_options().thresholds.validation_errors())
		{
			errors.push_back(error);
		}
	}

	if (auto_reconnect.enabled && auto_reconnect.interval_seconds == 0)
	{
		errors.push_back("Auto-reconnect interval must be greater than 0");
	}

	if (leak_detection.enabled && leak_detection.threshold_seconds == 0)
	{
		errors.push_back("Leak detection threshold must be greater than 0");
	}

	if (slow_query.enabled && slow_query.threshold_ms == 0)
	{
		errors.push_back("Slow query threshold must be greater than 0");
	}

	if (resource_supervisor::logging::parse_log_level(logging.level).is_err())
	{
		errors.push_back("Unknown log level: " + logging.level);
	}

	for (const auto& error : metrics.validation_errors())
	{
		errors.push_back(error);
	}

	return errors;
}

resilience::health_check_options supervisor_config::to_health_check_options() const
{
	resilience::health_check_options options;
	options.interval = std::chrono::seconds(health_check.interval_seconds);
	options.custom_query = health_check.custom_query;
	options.max_failures = health_check.max_failures;
	return options;
}

resilience::backoff_policy supervisor_config::to_backoff_policy() const
{
	resilience::backoff_policy policy;
	policy.initial_delay = std::chrono::seconds(retry.initial_delay_seconds);
	policy.max_delay = std::chrono::seconds(retry.max_delay_seconds);
	policy.multiplier = retry.multiplier;
	policy.max_attempts = retry.max_attempts;
	return policy;
}

resilience::auto_reconnect_options supervisor_config::to_auto_reconnect_options() const
{
	resilience::auto_reconnect_options options;
	options.interval = std::chrono::seconds(auto_reconnect.interval_seconds);
	options.max_attempts = auto_reconnect.max_attempts;
	return options;
}

monitoring::pool_monitor_options supervisor_config::to_pool_monitor_options() const
{
	monitoring::pool_monitor_options options;
	options.interval = std::chrono::seconds(monitor.interval_seconds);
	options.thresholds.usage_percentage = monitor.usage_threshold;
	options.thresholds.wait_duration = std::chrono::seconds(monitor.wait_threshold_seconds);
	options.thresholds.wait_count = monitor.wait_count_threshold;
	return options;
}

monitoring::leak_detector_options supervisor_config::to_leak_detector_options() const
{
	monitoring::leak_detector_options options;
	options.wait_threshold = std::chrono::seconds(leak_detection.threshold_seconds);
	return options;
}

monitoring::query_monitor_options supervisor_config::to_query_monitor_options() const
{
	monitoring::query_monitor_options options;
	options.enabled = slow_query.enabled;
	options.slow_threshold = std::chrono::milliseconds(slow_query.threshold_ms);
	return options;
}

} // namespace resource_supervisor::core
