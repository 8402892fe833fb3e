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
 * @file supervisor_config_test.cpp
 * @brief Unit tests for supervisor settings
 *
 * Tests cover:
 * - Defaults
 * - Dotted-key parsing and malformed values
 * - Validation rules
 * - Conversion to supervisor options
 */

#include <gtest/gtest.h>

#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/core/supervisor_config.h>
#include <kcenon/resource_supervisor/logging/console_logger.h>

#include <algorithm>
#include <chrono>
#include <string>

using namespace resource_supervisor;
using namespace resource_supervisor::core;
using namespace std::chrono_literals;

namespace
{

bool contains_error(const std::vector<std::string>& errors, const std::string& fragment)
{
	return std::any_of(errors.begin(), errors.end(), [&](const std::string& error) {
		return error.find(fragment) != std::string::npos;
	});
}

} // namespace

// ============================================================================
// Default Tests
// ============================================================================

class SupervisorConfigTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

TEST_F(SupervisorConfigTest, DefaultValues)
{
	auto config = supervisor_config::default_config();

	EXPECT_EQ(config.name, "resource");
	EXPECT_TRUE(config.health_check.enabled);
	EXPECT_EQ(config.health_check.interval_seconds, 30u);
	EXPECT_EQ(config.health_check.max_failures, 3u);
	EXPECT_TRUE(config.retry.enabled);
	EXPECT_EQ(config.retry.max_attempts, 3u);
	EXPECT_EQ(config.retry.initial_delay_seconds, 1u);
	EXPECT_EQ(config.retry.max_delay_seconds, 30u);
	EXPECT_DOUBLE_EQ(config.retry.multiplier, 2.0);
	EXPECT_TRUE(config.monitor.enabled);
	EXPECT_EQ(config.monitor.interval_seconds, 30u);
	EXPECT_DOUBLE_EQ(config.monitor.usage_threshold, 0.8);
	EXPECT_EQ(config.monitor.wait_threshold_seconds, 5u);
	EXPECT_EQ(config.monitor.wait_count_threshold, 10);
	EXPECT_TRUE(config.auto_reconnect.enabled);
	EXPECT_EQ(config.auto_reconnect.interval_seconds, 5u);
	EXPECT_EQ(config.auto_reconnect.max_attempts, 0u);
	EXPECT_FALSE(config.leak_detection.enabled);
	EXPECT_EQ(config.leak_detection.threshold_seconds, 300u);
	EXPECT_FALSE(config.slow_query.enabled);
	EXPECT_EQ(config.slow_query.threshold_ms, 1000u);
	EXPECT_EQ(config.logging.level, "info");
	EXPECT_TRUE(config.validate());
}

// ============================================================================
// Settings Parsing Tests
// ============================================================================

TEST_F(SupervisorConfigTest, FromSettingsAppliesKeys)
{
	auto parsed = supervisor_config::from_settings({
		{ "name", "orders-db" },
		{ "health_check.interval_seconds", "10" },
		{ "health_check.custom_query", " SELECT 1 " },
		{ "monitor.usage_threshold", "0.85" },
		{ "monitor.wait_count_threshold", "25" },
		{ "auto_reconnect.max_attempts", "10" },
		{ "leak_detection.enabled", "true" },
		{ "slow_query.enabled", "on" },
		{ "slow_query.threshold_ms", "250" },
		{ "retry.multiplier", "1.5" },
		{ "logging.level", "debug" },
		{ "metrics.namespace", "app" },
		{ "metrics.label.instance", "primary" },
	});

	ASSERT_TRUE(parsed.is_ok());
	const auto& config = parsed.value();
	EXPECT_EQ(config.name, "orders-db");
	EXPECT_EQ(config.health_check.interval_seconds, 10u);
	EXPECT_EQ(config.health_check.custom_query, "SELECT 1");
	EXPECT_DOUBLE_EQ(config.monitor.usage_threshold, 0.85);
	EXPECT_EQ(config.monitor.wait_count_threshold, 25);
	EXPECT_EQ(config.auto_reconnect.max_attempts, 10u);
	EXPECT_TRUE(config.leak_detection.enabled);
	EXPECT_TRUE(config.slow_query.enabled);
	EXPECT_EQ(config.slow_query.threshold_ms, 250u);
	EXPECT_DOUBLE_EQ(config.retry.multiplier, 1.5);
	EXPECT_EQ(config.logging.level, "debug");
	EXPECT_EQ(config.metrics.ns, "app");
	EXPECT_EQ(config.metrics.labels.at("instance"), "primary");
	EXPECT_TRUE(config.validate());
}

TEST_F(SupervisorConfigTest, UnknownKeysAreIgnored)
{
	auto parsed = supervisor_config::from_settings({ { "driver.dsn", "postgres://x" } });

	ASSERT_TRUE(parsed.is_ok());
	EXPECT_EQ(parsed.value().name, "resource");
}

TEST_F(SupervisorConfigTest, MalformedNumberIsRejected)
{
	auto parsed = supervisor_config::from_settings({ { "monitor.interval_seconds", "soon" } });

	ASSERT_TRUE(parsed.is_err());
	EXPECT_EQ(parsed.error().code, error_codes::invalid_setting_value);
	EXPECT_EQ(parsed.error().message, "Invalid value 'soon' for setting monitor.interval_seconds");
}

TEST_F(SupervisorConfigTest, NegativeUnsignedIsRejected)
{
	auto parsed = supervisor_config::from_settings({ { "health_check.max_failures", "-1" } });

	ASSERT_TRUE(parsed.is_err());
}

TEST_F(SupervisorConfigTest, MalformedBoolIsRejected)
{
	auto parsed = supervisor_config::from_settings({ { "retry.enabled", "maybe" } });

	ASSERT_TRUE(parsed.is_err());
	EXPECT_EQ(parsed.error().code, error_codes::invalid_setting_value);
}

TEST_F(SupervisorConfigTest, MalformedDoubleIsRejected)
{
	auto parsed = supervisor_config::from_settings({ { "monitor.usage_threshold", "80%" } });

	ASSERT_TRUE(parsed.is_err());
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(SupervisorConfigTest, UsageThresholdMustBeAFraction)
{
	auto config = supervisor_config::default_config();
	config.monitor.usage_threshold = 0.0;
	EXPECT_FALSE(config.validate());

	config.monitor.usage_threshold = 1.01;
	EXPECT_FALSE(config.validate());

	config.monitor.usage_threshold = 1.0;
	EXPECT_TRUE(config.validate());
}

TEST_F(SupervisorConfigTest, ZeroIntervalsOnlyMatterWhenEnabled)
{
	auto config = supervisor_config::default_config();
	config.health_check.interval_seconds = 0;
	config.auto_reconnect.interval_seconds = 0;

	auto errors = config.validation_errors();
	EXPECT_TRUE(contains_error(errors, "Health check interval"));
	EXPECT_TRUE(contains_error(errors, "Auto-reconnect interval"));

	config.health_check.enabled = false;
	config.auto_reconnect.enabled = false;
	EXPECT_TRUE(config.validate());
}

TEST_F(SupervisorConfigTest, RetryRules)
{
	auto config = supervisor_config::default_config();
	config.retry.multiplier = 0.5;
	config.retry.initial_delay_seconds = 60;

	auto errors = config.validation_errors();
	EXPECT_TRUE(contains_error(errors, "multiplier"));
	EXPECT_TRUE(contains_error(errors, "initial_delay cannot exceed max_delay"));
}

TEST_F(SupervisorConfigTest, UnknownLogLevel)
{
	auto config = supervisor_config::default_config();
	config.logging.level = "verbose";

	EXPECT_TRUE(contains_error(config.validation_errors(), "Unknown log level: verbose"));
}

TEST_F(SupervisorConfigTest, EmptyNameIsInvalid)
{
	auto config = supervisor_config::default_config();
	config.name.clear();

	EXPECT_FALSE(config.validate());
}

// ============================================================================
// Conversion Tests
// ============================================================================

TEST_F(SupervisorConfigTest, ConvertsToSupervisorOptions)
{
	auto config = supervisor_config::default_config();
	config.health_check.custom_query = "SELECT 1";
	config.monitor.wait_threshold_seconds = 7;
	config.leak_detection.threshold_seconds = 120;
	config.slow_query.enabled = true;
	config.slow_query.threshold_ms = 250;

	auto health = config.to_health_check_options();
	auto backoff = config.to_backoff_policy();
	auto reconnect = config.to_auto_reconnect_options();
	auto monitor = config.to_pool_monitor_options();
	auto leaks = config.to_leak_detector_options();
	auto queries = config.to_query_monitor_options();

	EXPECT_EQ(health.interval, 30s);
	EXPECT_EQ(health.custom_query, "SELECT 1");
	EXPECT_EQ(health.max_failures, 3u);
	EXPECT_EQ(backoff.initial_delay, 1s);
	EXPECT_EQ(backoff.max_delay, 30s);
	EXPECT_EQ(backoff.max_attempts, 3u);
	EXPECT_EQ(reconnect.interval, 5s);
	EXPECT_EQ(monitor.interval, 30s);
	EXPECT_DOUBLE_EQ(monitor.thresholds.usage_percentage, 0.8);
	EXPECT_EQ(monitor.thresholds.wait_duration, 7s);
	EXPECT_EQ(monitor.thresholds.wait_count, 10);
	EXPECT_EQ(leaks.wait_threshold, 120s);
	EXPECT_TRUE(queries.enabled);
	EXPECT_EQ(queries.slow_threshold, 250ms);
}

// ============================================================================
// Log Level Tests
// ============================================================================

TEST_F(SupervisorConfigTest, LogLevelNames)
{
	using kcenon::common::interfaces::log_level;

	EXPECT_EQ(logging::parse_log_level("debug").value(), log_level::debug);
	EXPECT_EQ(logging::parse_log_level("INFO").value(), log_level::info);
	EXPECT_EQ(logging::parse_log_level("warn").value(), log_level::warning);
	EXPECT_EQ(logging::parse_log_level("warning").value(), log_level::warning);
	EXPECT_EQ(logging::parse_log_level("error").value(), log_level::error);
	EXPECT_TRUE(logging::parse_log_level("loud").is_err());
}
