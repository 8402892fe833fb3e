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
 * @file log_helpers_test.cpp
 * @brief Unit tests for the shared log write and formatting helpers
 */

#include <gtest/gtest.h>

#include "test_support.h"

#include <kcenon/resource_supervisor/logging/log_helpers.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace resource_supervisor;
using namespace resource_supervisor::test_support;
using namespace std::chrono_literals;

using kcenon::common::interfaces::log_level;

namespace
{

class throwing_logger : public capturing_logger
{
public:
	using capturing_logger::log;

	kcenon::common::VoidResult log(log_level, const std::string&) override
	{
		throw std::runtime_error("disk full");
	}
};

class failing_logger : public capturing_logger
{
public:
	using capturing_logger::log;

	kcenon::common::VoidResult log(log_level, const std::string&) override
	{
		return kcenon::common::error_info{ -1, "sink closed", "test" };
	}
};

} // namespace

// ============================================================================
// Write Tests
// ============================================================================

class LogHelpersTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

TEST_F(LogHelpersTest, WritesThroughLogger)
{
	auto logger = std::make_shared<capturing_logger>();

	logging::write_log(logger, log_level::info, "pool ok");

	EXPECT_EQ(logger->count_containing("pool ok"), 1u);
}

TEST_F(LogHelpersTest, NullLoggerFallsBackToStderr)
{
	::testing::internal::CaptureStderr();
	logging::write_log(nullptr, log_level::warning, "no logger here");
	const auto output = ::testing::internal::GetCapturedStderr();

	EXPECT_NE(output.find("no logger here"), std::string::npos);
}

TEST_F(LogHelpersTest, LoggerErrorFallsBackToStderr)
{
	auto logger = std::make_shared<failing_logger>();

	::testing::internal::CaptureStderr();
	logging::write_log(logger, log_level::error, "reconnect failed");
	const auto output = ::testing::internal::GetCapturedStderr();

	EXPECT_NE(output.find("reconnect failed"), std::string::npos);
	EXPECT_NE(output.find("logger error: sink closed"), std::string::npos);
}

TEST_F(LogHelpersTest, ThrowingLoggerFallsBackToStderr)
{
	auto logger = std::make_shared<throwing_logger>();

	::testing::internal::CaptureStderr();
	EXPECT_NO_THROW(logging::write_log(logger, log_level::warning, "pool saturated"));
	const auto output = ::testing::internal::GetCapturedStderr();

	EXPECT_NE(output.find("pool saturated"), std::string::npos);
	EXPECT_NE(output.find("logger threw: disk full"), std::string::npos);
}

// ============================================================================
// Formatting Tests
// ============================================================================

TEST_F(LogHelpersTest, FormatDuration)
{
	EXPECT_EQ(logging::format_duration(0ns), "0s");
	EXPECT_EQ(logging::format_duration(500ns), "500ns");
	EXPECT_EQ(logging::format_duration(1500ns), "1.5us");
	EXPECT_EQ(logging::format_duration(100ms), "100ms");
	EXPECT_EQ(logging::format_duration(1500us), "1.5ms");
	EXPECT_EQ(logging::format_duration(2s), "2s");
}

TEST_F(LogHelpersTest, FormatSnapshot)
{
	core::pool_snapshot snapshot;
	snapshot.max_open = 20;
	snapshot.open = 18;
	snapshot.in_use = 17;
	snapshot.idle = 1;

	const auto text = logging::format_snapshot(snapshot);

	EXPECT_NE(text.find("Open=18/20"), std::string::npos);
	EXPECT_NE(text.find("InUse=17"), std::string::npos);
	EXPECT_NE(text.find("Idle=1"), std::string::npos);
}
