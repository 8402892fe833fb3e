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
 * @file health_checker_test.cpp
 * @brief Unit tests for the health checker
 *
 * Tests cover:
 * - Factory validation
 * - Failure counting and transition logging
 * - Recovery after the failure threshold, once per streak
 * - Background probing and idempotent stop
 */

#include <gtest/gtest.h>

#include "test_support.h"

#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/resilience/health_checker.h>

#include <chrono>
#include <memory>
#include <type_traits>
#include <thread>

using namespace resource_supervisor;
using namespace resource_supervisor::resilience;
using namespace resource_supervisor::test_support;
using namespace std::chrono_literals;
using kcenon::common::interfaces::log_level;

// ============================================================================
// Factory Tests
// ============================================================================

class HealthCheckerFactoryTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

TEST_F(HealthCheckerFactoryTest, NullTargetIsRejected)
{
	auto result = health_checker::create(nullptr);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::null_target);
}

TEST_F(HealthCheckerFactoryTest, ZeroIntervalIsRejected)
{
	fake_resource resource;
	health_check_options options;
	options.interval = 0ms;

	auto result = health_checker::create(&resource, options);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::invalid_interval);
}

TEST_F(HealthCheckerFactoryTest, ConstructionGoesThroughCreate)
{
	static_assert(!std::is_constructible_v<health_checker, core::health_checkable*, core::recoverable*, health_check_options,
								  core::supervisor_dependencies>);
	static_assert(!std::is_default_constructible_v<health_checker>);

	fake_resource resource;
	auto created = health_checker::create(&resource);

	ASSERT_TRUE(created.is_ok());
	EXPECT_NE(created.value(), nullptr);
	EXPECT_FALSE(created.value()->is_running());
}

TEST_F(HealthCheckerFactoryTest, ZeroMaxFailuresIsRejected)
{
	fake_resource resource;
	health_check_options options;
	options.max_failures = 0;

	auto result = health_checker::create(&resource, options);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::invalid_failure_threshold);
}

TEST_F(HealthCheckerFactoryTest, DefaultOptions)
{
	health_check_options options;

	EXPECT_EQ(options.interval, 30s);
	EXPECT_EQ(options.max_failures, 3u);
	EXPECT_TRUE(options.custom_query.empty());
}

TEST_F(HealthCheckerFactoryTest, RecoverableTargetIsDetected)
{
	fake_resource resource;
	health_only_resource probe_only;

	auto recoverable = health_checker::create(&resource);
	auto not_recoverable = health_checker::create(&probe_only);

	ASSERT_TRUE(recoverable.is_ok());
	ASSERT_TRUE(not_recoverable.is_ok());
	EXPECT_TRUE(recoverable.value()->can_recover());
	EXPECT_FALSE(not_recoverable.value()->can_recover());
}

TEST_F(HealthCheckerFactoryTest, StartsOptimisticallyHealthy)
{
	fake_resource resource;
	auto checker = std::move(health_checker::create(&resource).unwrap());

	EXPECT_TRUE(checker->is_healthy());
	EXPECT_EQ(checker->consecutive_failures(), 0u);
	EXPECT_FALSE(checker->is_running());
}

// ============================================================================
// Probe Cycle Tests
// ============================================================================

class HealthCheckerCycleTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		logger_ = std::make_shared<capturing_logger>();
		recorder_ = std::make_shared<counting_recorder>();
	}

	void TearDown() override {}

	std::unique_ptr<health_checker> make_checker(core::health_checkable* target,
												 uint32_t max_failures = 3)
	{
		health_check_options options;
		options.interval = 1h;
		options.max_failures = max_failures;
		auto created = health_checker::create(target, options,
											  make_dependencies(logger_, recorder_));
		EXPECT_TRUE(created.is_ok());
		return std::move(created.unwrap());
	}

	std::shared_ptr<capturing_logger> logger_;
	std::shared_ptr<counting_recorder> recorder_;
};

TEST_F(HealthCheckerCycleTest, SuccessKeepsHealthyState)
{
	fake_resource resource;
	auto checker = make_checker(&resource);

	auto state = checker->check_now();

	EXPECT_TRUE(state.is_healthy);
	EXPECT_EQ(state.consecutive_failures, 0u);
	EXPECT_EQ(recorder_->health_success.load(), 1);
	EXPECT_EQ(logger_->lines().size(), 0u);
}

TEST_F(HealthCheckerCycleTest, FailuresAreCountedConsecutively)
{
	health_only_resource resource;
	auto checker = make_checker(&resource, 10);

	for (uint32_t i = 1; i <= 5; ++i)
	{
		auto state = checker->check_now();
		EXPECT_FALSE(state.is_healthy);
		EXPECT_EQ(state.consecutive_failures, i);
	}

	EXPECT_EQ(recorder_->health_failure.load(), 5);
}

TEST_F(HealthCheckerCycleTest, FailureTransitionIsLoggedOnce)
{
	health_only_resource resource;
	auto checker = make_checker(&resource, 10);

	checker->check_now();
	checker->check_now();
	checker->check_now();

	EXPECT_EQ(logger_->count_containing("Health check failed for probe-only: timeout"), 1u);
}

TEST_F(HealthCheckerCycleTest, SuccessResetsFailureCount)
{
	fake_resource resource;
	resource.reconnect_succeeds = false;
	auto checker = make_checker(&resource, 10);

	resource.healthy = false;
	checker->check_now();
	checker->check_now();
	EXPECT_EQ(checker->consecutive_failures(), 2u);

	resource.healthy = true;
	auto state = checker->check_now();

	EXPECT_TRUE(state.is_healthy);
	EXPECT_EQ(state.consecutive_failures, 0u);
	EXPECT_EQ(logger_->count_containing("Health check recovered for test-db"), 1u);
}

TEST_F(HealthCheckerCycleTest, CountMatchesFailuresSinceLastSuccess)
{
	fake_resource resource;
	resource.reconnect_succeeds = false;
	auto checker = make_checker(&resource, 100);

	const bool sequence[] = { false, false, true, false, true, true, false, false, false };
	uint32_t expected = 0;
	for (bool ok : sequence)
	{
		resource.healthy = ok;
		expected = ok ? 0 : expected + 1;
		EXPECT_EQ(checker->check_now().consecutive_failures, expected);
	}
}

TEST_F(HealthCheckerCycleTest, NoRecoveryWithoutRecoverableTarget)
{
	health_only_resource resource;
	auto checker = make_checker(&resource);

	for (int i = 0; i < 5; ++i)
	{
		checker->check_now();
	}

	EXPECT_EQ(checker->recovery_attempts(), 0u);
	EXPECT_EQ(checker->consecutive_failures(), 5u);
}

// ============================================================================
// Recovery Tests
// ============================================================================

TEST_F(HealthCheckerCycleTest, RecoveryAtThresholdRestoresHealth)
{
	fake_resource resource;
	auto checker = make_checker(&resource, 3);

	resource.healthy = false;
	checker->check_now();
	checker->check_now();
	EXPECT_EQ(resource.reconnect_calls.load(), 0);

	auto state = checker->check_now();

	EXPECT_EQ(resource.reconnect_calls.load(), 1);
	EXPECT_TRUE(state.is_healthy);
	EXPECT_EQ(state.consecutive_failures, 0u);
	EXPECT_TRUE(checker->is_healthy());
	EXPECT_EQ(recorder_->connect_attempts.load(), 1);
	EXPECT_EQ(recorder_->connect_successes.load(), 1);
	EXPECT_EQ(logger_->count_containing("Recovered test-db"), 1u);
}

TEST_F(HealthCheckerCycleTest, FailedRecoveryLeavesStateUnchanged)
{
	fake_resource resource;
	resource.reconnect_succeeds = false;
	auto checker = make_checker(&resource, 3);

	resource.healthy = false;
	checker->check_now();
	checker->check_now();
	auto state = checker->check_now();

	EXPECT_EQ(resource.reconnect_calls.load(), 1);
	EXPECT_FALSE(state.is_healthy);
	EXPECT_EQ(state.consecutive_failures, 3u);
	EXPECT_EQ(recorder_->connect_failures.load(), 1);
	EXPECT_EQ(logger_->count_containing("Recovery of test-db failed: host unreachable"), 1u);
}

TEST_F(HealthCheckerCycleTest, OneRecoveryPerFailureStreak)
{
	fake_resource resource;
	resource.reconnect_succeeds = false;
	auto checker = make_checker(&resource, 3);

	resource.healthy = false;
	for (int i = 0; i < 8; ++i)
	{
		checker->check_now();
	}

	EXPECT_EQ(resource.reconnect_calls.load(), 1);
	EXPECT_EQ(checker->recovery_attempts(), 1u);
	EXPECT_EQ(checker->consecutive_failures(), 8u);
}

TEST_F(HealthCheckerCycleTest, RecoveryRearmsAfterSuccess)
{
	fake_resource resource;
	resource.reconnect_succeeds = false;
	auto checker = make_checker(&resource, 2);

	resource.healthy = false;
	checker->check_now();
	checker->check_now();
	checker->check_now();
	EXPECT_EQ(resource.reconnect_calls.load(), 1);

	resource.healthy = true;
	checker->check_now();

	resource.healthy = false;
	checker->check_now();
	checker->check_now();

	EXPECT_EQ(resource.reconnect_calls.load(), 2);
}

TEST_F(HealthCheckerCycleTest, ExplicitRecoveryCapabilityIsUsed)
{
	health_only_resource probe;
	fake_resource recovery;

	health_check_options options;
	options.interval = 1h;
	options.max_failures = 1;
	auto checker = std::move(health_checker::create(&probe, options,
													make_dependencies(logger_, recorder_),
													&recovery)
								 .unwrap());

	checker->check_now();

	EXPECT_TRUE(checker->can_recover());
	EXPECT_EQ(recovery.reconnect_calls.load(), 1);
}

TEST_F(HealthCheckerCycleTest, StateReadableDuringSlowRecovery)
{
	fake_resource resource;
	resource.reconnect_delay = 300ms;
	auto checker = make_checker(&resource, 1);

	resource.healthy = false;
	std::thread probe([&] { checker->check_now(); });

	ASSERT_TRUE(wait_until([&] { return resource.reconnects_in_flight.load() == 1; }));

	const auto before = std::chrono::steady_clock::now();
	EXPECT_FALSE(checker->is_healthy());
	EXPECT_LT(std::chrono::steady_clock::now() - before, 200ms);

	probe.join();
	EXPECT_TRUE(checker->is_healthy());
}

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(HealthCheckerCycleTest, BackgroundProbing)
{
	fake_resource resource;
	health_check_options options;
	options.interval = 20ms;
	auto checker = std::move(
		health_checker::create(&resource, options, make_dependencies(logger_, recorder_)).unwrap());

	ASSERT_TRUE(checker->start().is_ok());
	EXPECT_TRUE(checker->is_running());

	EXPECT_TRUE(wait_until([&] { return resource.health_calls.load() >= 3; }));

	checker->stop();
	EXPECT_FALSE(checker->is_running());
}

TEST_F(HealthCheckerCycleTest, StopTwiceIsHarmless)
{
	fake_resource resource;
	health_check_options options;
	options.interval = 20ms;
	auto checker = std::move(
		health_checker::create(&resource, options, make_dependencies(logger_, recorder_)).unwrap());

	ASSERT_TRUE(checker->start().is_ok());
	checker->stop();
	checker->stop();

	const int calls = resource.health_calls.load();
	std::this_thread::sleep_for(60ms);
	EXPECT_EQ(resource.health_calls.load(), calls);
}

TEST_F(HealthCheckerCycleTest, CancelledTokenStopsProbing)
{
	fake_resource resource;
	health_check_options options;
	options.interval = 20ms;
	auto checker = std::move(
		health_checker::create(&resource, options, make_dependencies(logger_, recorder_)).unwrap());

	auto token = kcenon::thread::cancellation_token::create();
	ASSERT_TRUE(checker->start(token).is_ok());

	token.cancel();

	EXPECT_TRUE(wait_until([&] { return !checker->is_running(); }));
}
