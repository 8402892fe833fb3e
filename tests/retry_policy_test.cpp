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
 * @file retry_policy_test.cpp
 * @brief Unit tests for startup connection retry with backoff
 */

#include <gtest/gtest.h>

#include "test_support.h"

#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/resilience/retry_policy.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace resource_supervisor;
using namespace resource_supervisor::resilience;
using namespace resource_supervisor::test_support;
using namespace std::chrono_literals;

// ============================================================================
// Backoff Policy Tests
// ============================================================================

class BackoffPolicyTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

TEST_F(BackoffPolicyTest, DefaultValues)
{
	backoff_policy policy;

	EXPECT_EQ(policy.initial_delay, 1s);
	EXPECT_EQ(policy.max_delay, 30s);
	EXPECT_DOUBLE_EQ(policy.multiplier, 2.0);
	EXPECT_EQ(policy.max_attempts, 3u);
	EXPECT_TRUE(policy.validate());
}

TEST_F(BackoffPolicyTest, DelayGrowsExponentially)
{
	backoff_policy policy;

	EXPECT_EQ(policy.delay_for(0), 1s);
	EXPECT_EQ(policy.delay_for(1), 2s);
	EXPECT_EQ(policy.delay_for(2), 4s);
	EXPECT_EQ(policy.delay_for(3), 8s);
}

TEST_F(BackoffPolicyTest, DelayIsCappedAtMax)
{
	backoff_policy policy;

	EXPECT_EQ(policy.delay_for(5), 30s);
	EXPECT_EQ(policy.delay_for(40), 30s);
}

TEST_F(BackoffPolicyTest, ConstantBackoffWithUnitMultiplier)
{
	backoff_policy policy;
	policy.initial_delay = 250ms;
	policy.multiplier = 1.0;

	EXPECT_EQ(policy.delay_for(0), 250ms);
	EXPECT_EQ(policy.delay_for(7), 250ms);
}

TEST_F(BackoffPolicyTest, InvalidPolicies)
{
	backoff_policy no_attempts;
	no_attempts.max_attempts = 0;

	backoff_policy shrinking;
	shrinking.multiplier = 0.5;

	backoff_policy inverted;
	inverted.initial_delay = 60s;
	inverted.max_delay = 10s;

	EXPECT_FALSE(no_attempts.validate());
	EXPECT_FALSE(shrinking.validate());
	EXPECT_FALSE(inverted.validate());
}

// ============================================================================
// Connect With Retry Tests
// ============================================================================

class ConnectWithRetryTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		logger_ = std::make_shared<capturing_logger>();
		recorder_ = std::make_shared<counting_recorder>();

		policy_.initial_delay = 1ms;
		policy_.max_delay = 5ms;
		policy_.max_attempts = 4;
	}

	void TearDown() override {}

	connect_function failing_until(int successful_call)
	{
		return [this, successful_call]() -> kcenon::common::VoidResult {
			if (calls_.fetch_add(1) + 1 >= successful_call)
			{
				return kcenon::common::ok();
			}
			return kcenon::common::error_info{ -1, "connection refused", "test" };
		};
	}

	std::shared_ptr<capturing_logger> logger_;
	std::shared_ptr<counting_recorder> recorder_;
	backoff_policy policy_;
	std::atomic<int> calls_{ 0 };
};

TEST_F(ConnectWithRetryTest, FirstAttemptSucceeds)
{
	auto result = connect_with_retry(failing_until(1), policy_,
									 make_dependencies(logger_, recorder_), "orders");

	EXPECT_TRUE(result.is_ok());
	EXPECT_EQ(calls_.load(), 1);
	EXPECT_EQ(recorder_->connect_attempts.load(), 1);
	EXPECT_EQ(recorder_->connect_retries.load(), 0);
	EXPECT_EQ(recorder_->connect_successes.load(), 1);
}

TEST_F(ConnectWithRetryTest, SucceedsAfterRetries)
{
	auto result = connect_with_retry(failing_until(3), policy_,
									 make_dependencies(logger_, recorder_), "orders");

	EXPECT_TRUE(result.is_ok());
	EXPECT_EQ(calls_.load(), 3);
	EXPECT_EQ(recorder_->connect_attempts.load(), 3);
	EXPECT_EQ(recorder_->connect_retries.load(), 2);
	EXPECT_EQ(recorder_->connect_failures.load(), 2);
	EXPECT_EQ(recorder_->connect_successes.load(), 1);
	EXPECT_EQ(logger_->count_containing("Connected to orders after 3 attempts"), 1u);
}

TEST_F(ConnectWithRetryTest, ExhaustionReportsLastError)
{
	auto result = connect_with_retry(failing_until(100), policy_,
									 make_dependencies(logger_, recorder_), "orders");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::retry_exhausted);
	EXPECT_EQ(result.error().message,
			  "Failed to connect to orders after 4 attempts: connection refused");
	EXPECT_EQ(calls_.load(), 4);
	EXPECT_EQ(recorder_->connect_failures.load(), 4);
	EXPECT_EQ(recorder_->connect_successes.load(), 0);
}

TEST_F(ConnectWithRetryTest, EmptyConnectFunctionIsRejected)
{
	auto result = connect_with_retry(nullptr, policy_, make_dependencies(logger_, recorder_),
									 "orders");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::invalid_configuration);
}

TEST_F(ConnectWithRetryTest, InvalidPolicyIsRejected)
{
	policy_.max_attempts = 0;

	auto result = connect_with_retry(failing_until(1), policy_,
									 make_dependencies(logger_, recorder_), "orders");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::invalid_configuration);
	EXPECT_EQ(calls_.load(), 0);
}

TEST_F(ConnectWithRetryTest, CancellationInterruptsBackoff)
{
	policy_.initial_delay = 10s;
	policy_.max_delay = 10s;
	auto token = kcenon::thread::cancellation_token::create();

	auto pending = std::async(std::launch::async, [&] {
		return connect_with_retry(failing_until(100), policy_,
								  make_dependencies(logger_, recorder_), "orders", token);
	});

	ASSERT_TRUE(wait_until([&] { return calls_.load() >= 1; }));
	const auto before = std::chrono::steady_clock::now();
	token.cancel();

	auto result = pending.get();
	EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::retry_cancelled);
	EXPECT_EQ(calls_.load(), 1);
}

TEST_F(ConnectWithRetryTest, CancelledTokenSkipsBackoff)
{
	policy_.initial_delay = 10s;
	policy_.max_delay = 10s;
	auto token = kcenon::thread::cancellation_token::create();
	token.cancel();

	const auto before = std::chrono::steady_clock::now();
	auto result = connect_with_retry(failing_until(100), policy_,
									 make_dependencies(logger_, recorder_), "orders", token);

	EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::retry_cancelled);
	EXPECT_EQ(calls_.load(), 1);
}

TEST_F(ConnectWithRetryTest, WorksWithDefaultDependencies)
{
	auto result = connect_with_retry(failing_until(2), policy_, {}, "orders");

	EXPECT_TRUE(result.is_ok());
	EXPECT_EQ(calls_.load(), 2);
}
