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
 * @file metrics_registry_test.cpp
 * @brief Unit tests for the metrics recorder contract and registry
 *
 * Tests cover:
 * - No-op recorder accepts every call
 * - Pool gauges, health, query, transaction and connect counters
 * - Slow query classification
 * - Disabled registries, reset and export naming
 */

#include <gtest/gtest.h>

#include <kcenon/resource_supervisor/metrics/metrics_recorder.h>
#include <kcenon/resource_supervisor/metrics/metrics_registry.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace resource_supervisor;
using namespace resource_supervisor::metrics;
using namespace std::chrono_literals;

namespace
{

core::pool_snapshot sample_snapshot()
{
	core::pool_snapshot snapshot;
	snapshot.max_open = 20;
	snapshot.open = 18;
	snapshot.in_use = 15;
	snapshot.idle = 3;
	snapshot.max_idle = 5;
	snapshot.wait_count = 7;
	snapshot.wait_duration = 1500ms;
	snapshot.idle_closed_count = 2;
	snapshot.lifetime_closed_count = 4;
	return snapshot;
}

kcenon::common::error_info query_error()
{
	return kcenon::common::error_info{ -1, "syntax error", "test" };
}

} // namespace

// ============================================================================
// No-op Recorder Tests
// ============================================================================

class NoopRecorderTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

TEST_F(NoopRecorderTest, AcceptsEveryCall)
{
	auto recorder = create_noop_recorder();
	ASSERT_NE(recorder, nullptr);

	recorder->record_pool_stats(sample_snapshot());
	recorder->record_health_check(true);
	recorder->record_health_check(false);
	recorder->record_query(5ms, std::nullopt, 1s);
	recorder->record_query(5s, query_error(), 1s);
	recorder->record_tx(10ms, true);
	recorder->record_tx(10ms, false);
	recorder->inc_connect_attempt();
	recorder->inc_connect_retry();
	recorder->inc_connect_success();
	recorder->inc_connect_failure();
}

TEST_F(NoopRecorderTest, ConcurrentCallersNeverBlock)
{
	auto recorder = create_noop_recorder();
	std::vector<std::thread> threads;
	std::atomic<int> finished{ 0 };

	for (int t = 0; t < 4; ++t)
	{
		threads.emplace_back([&] {
			for (int i = 0; i < 10000; ++i)
			{
				recorder->record_health_check(i % 2 == 0);
				recorder->inc_connect_attempt();
			}
			finished.fetch_add(1);
		});
	}
	for (auto& thread : threads)
	{
		thread.join();
	}

	EXPECT_EQ(finished.load(), 4);
}

// ============================================================================
// Registry Tests
// ============================================================================

class MetricsRegistryTest : public ::testing::Test
{
protected:
	void SetUp() override { registry_ = std::make_unique<metrics_registry>(); }
	void TearDown() override {}

	std::unique_ptr<metrics_registry> registry_;
};

TEST_F(MetricsRegistryTest, DefaultConfig)
{
	auto config = metrics_config::default_config();

	EXPECT_TRUE(config.enabled);
	EXPECT_EQ(config.ns, "supervisor");
	EXPECT_EQ(config.subsystem, "pool");
	EXPECT_EQ(config.slow_query_threshold, 1s);
	EXPECT_TRUE(config.validate());
}

TEST_F(MetricsRegistryTest, ConfigValidation)
{
	metrics_config config;
	config.ns.clear();
	config.subsystem.clear();
	config.slow_query_threshold = 0s;

	EXPECT_FALSE(config.validate());
	EXPECT_EQ(config.validation_errors().size(), 2u);
}

TEST_F(MetricsRegistryTest, PoolGaugesReflectLatestSnapshot)
{
	registry_->record_pool_stats(sample_snapshot());

	auto second = sample_snapshot();
	second.open = 10;
	second.wait_count = 9;
	registry_->record_pool_stats(second);

	auto stats = registry_->get_statistics();
	EXPECT_DOUBLE_EQ(stats["max_open_connections"], 20.0);
	EXPECT_DOUBLE_EQ(stats["open_connections"], 10.0);
	EXPECT_DOUBLE_EQ(stats["in_use_connections"], 15.0);
	EXPECT_DOUBLE_EQ(stats["idle_connections"], 3.0);
	EXPECT_DOUBLE_EQ(stats["max_idle_connections"], 5.0);
	EXPECT_DOUBLE_EQ(stats["wait_count_total"], 9.0);
	EXPECT_DOUBLE_EQ(stats["wait_duration_seconds_total"], 1.5);
	EXPECT_DOUBLE_EQ(stats["max_idle_closed_total"], 2.0);
	EXPECT_DOUBLE_EQ(stats["max_lifetime_closed_total"], 4.0);
	EXPECT_EQ(registry_->pool().snapshots_recorded.load(), 2u);
}

TEST_F(MetricsRegistryTest, HealthChecksAreCounted)
{
	registry_->record_health_check(true);
	registry_->record_health_check(true);
	registry_->record_health_check(false);

	auto stats = registry_->get_statistics();
	EXPECT_DOUBLE_EQ(stats["health_check_total"], 3.0);
	EXPECT_DOUBLE_EQ(stats["health_check_success_total"], 2.0);
	EXPECT_DOUBLE_EQ(stats["health_check_failure_total"], 1.0);
}

TEST_F(MetricsRegistryTest, QueriesTrackErrorsAndLatency)
{
	registry_->record_query(2ms, std::nullopt, 1s);
	registry_->record_query(4ms, query_error(), 1s);
	registry_->record_query(6ms, std::nullopt, 1s);

	auto stats = registry_->get_statistics();
	EXPECT_DOUBLE_EQ(stats["queries_total"], 3.0);
	EXPECT_DOUBLE_EQ(stats["errors_total"], 1.0);
	EXPECT_DOUBLE_EQ(stats["slow_queries_total"], 0.0);
	EXPECT_DOUBLE_EQ(stats["query_latency_avg_ms"], 4.0);
	EXPECT_DOUBLE_EQ(stats["query_latency_min_ms"], 2.0);
	EXPECT_DOUBLE_EQ(stats["query_latency_max_ms"], 6.0);
	EXPECT_DOUBLE_EQ(stats["query_duration_seconds_sum"], 0.012);
}

TEST_F(MetricsRegistryTest, SlowQueryUsesCallerThreshold)
{
	registry_->record_query(500ms, std::nullopt, 500ms);
	registry_->record_query(499ms, std::nullopt, 500ms);

	EXPECT_EQ(registry_->queries().slow.load(), 1u);
}

TEST_F(MetricsRegistryTest, SlowQueryFallsBackToConfigThreshold)
{
	registry_->record_query(1s, std::nullopt, 0ns);
	registry_->record_query(900ms, std::nullopt, 0ns);

	EXPECT_EQ(registry_->queries().slow.load(), 1u);
}

TEST_F(MetricsRegistryTest, EmptyRegistryReportsZeroLatency)
{
	auto stats = registry_->get_statistics();

	EXPECT_DOUBLE_EQ(stats["query_latency_avg_ms"], 0.0);
	EXPECT_DOUBLE_EQ(stats["query_latency_min_ms"], 0.0);
	EXPECT_DOUBLE_EQ(stats["enabled"], 1.0);
}

TEST_F(MetricsRegistryTest, TransactionsAreSplitByOutcome)
{
	registry_->record_tx(100ms, true);
	registry_->record_tx(100ms, true);
	registry_->record_tx(300ms, false);

	auto stats = registry_->get_statistics();
	EXPECT_DOUBLE_EQ(stats["tx_commit_total"], 2.0);
	EXPECT_DOUBLE_EQ(stats["tx_rollback_total"], 1.0);
	EXPECT_DOUBLE_EQ(stats["tx_duration_seconds_sum"], 0.5);
}

TEST_F(MetricsRegistryTest, ConnectCounters)
{
	registry_->inc_connect_attempt();
	registry_->inc_connect_attempt();
	registry_->inc_connect_retry();
	registry_->inc_connect_failure();
	registry_->inc_connect_success();

	auto stats = registry_->get_statistics();
	EXPECT_DOUBLE_EQ(stats["connect_attempts_total"], 2.0);
	EXPECT_DOUBLE_EQ(stats["connect_retries_total"], 1.0);
	EXPECT_DOUBLE_EQ(stats["connect_failures_total"], 1.0);
	EXPECT_DOUBLE_EQ(stats["connect_success_total"], 1.0);
}

TEST_F(MetricsRegistryTest, DisabledRegistryIgnoresCalls)
{
	metrics_config config;
	config.enabled = false;
	metrics_registry registry(config);

	registry.record_pool_stats(sample_snapshot());
	registry.record_health_check(true);
	registry.record_query(5s, query_error(), 1s);
	registry.inc_connect_attempt();

	auto stats = registry.get_statistics();
	EXPECT_DOUBLE_EQ(stats["enabled"], 0.0);
	EXPECT_DOUBLE_EQ(stats["open_connections"], 0.0);
	EXPECT_DOUBLE_EQ(stats["health_check_total"], 0.0);
	EXPECT_DOUBLE_EQ(stats["queries_total"], 0.0);
	EXPECT_DOUBLE_EQ(stats["connect_attempts_total"], 0.0);
	EXPECT_TRUE(registry.export_metrics().empty());
}

TEST_F(MetricsRegistryTest, ResetClearsEverything)
{
	registry_->record_pool_stats(sample_snapshot());
	registry_->record_health_check(false);
	registry_->record_query(5ms, query_error(), 1s);
	registry_->inc_connect_retry();

	registry_->reset();

	auto stats = registry_->get_statistics();
	EXPECT_DOUBLE_EQ(stats["open_connections"], 0.0);
	EXPECT_DOUBLE_EQ(stats["health_check_failure_total"], 0.0);
	EXPECT_DOUBLE_EQ(stats["errors_total"], 0.0);
	EXPECT_DOUBLE_EQ(stats["connect_retries_total"], 0.0);
}

// ============================================================================
// Export Tests
// ============================================================================

TEST_F(MetricsRegistryTest, MetricNames)
{
	EXPECT_EQ(registry_->metric_name("open_connections"), "supervisor_pool_open_connections");

	metrics_config config;
	config.ns = "app";
	config.subsystem.clear();
	metrics_registry registry(config);

	EXPECT_EQ(registry.metric_name("queries_total"), "app_queries_total");
}

TEST_F(MetricsRegistryTest, ExportCarriesNamesAndLabels)
{
	metrics_config config;
	config.subsystem = "orders_db";
	config.labels["instance"] = "primary";
	metrics_registry registry(config);
	registry.record_health_check(true);

	auto exported = registry.export_metrics();

	auto it = std::find_if(exported.begin(), exported.end(), [](const exported_metric& metric) {
		return metric.name == "supervisor_orders_db_health_check_total";
	});
	ASSERT_NE(it, exported.end());
	EXPECT_DOUBLE_EQ(it->value, 1.0);
	EXPECT_EQ(it->labels.at("instance"), "primary");

	EXPECT_TRUE(std::none_of(exported.begin(), exported.end(), [](const exported_metric& metric) {
		return metric.name.find("enabled") != std::string::npos;
	}));
}

TEST_F(MetricsRegistryTest, ConcurrentRecordingIsLossless)
{
	std::vector<std::thread> threads;
	for (int t = 0; t < 4; ++t)
	{
		threads.emplace_back([this] {
			for (int i = 0; i < 1000; ++i)
			{
				registry_->record_health_check(true);
				registry_->record_query(1ms, std::nullopt, 1s);
			}
		});
	}
	for (auto& thread : threads)
	{
		thread.join();
	}

	EXPECT_EQ(registry_->health_checks().total.load(), 4000u);
	EXPECT_EQ(registry_->queries().total.load(), 4000u);
}
