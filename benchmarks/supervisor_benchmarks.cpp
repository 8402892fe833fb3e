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
 * @file supervisor_benchmarks.cpp
 * @brief Overhead of the supervisor hot paths
 *
 * Benchmarks cover:
 * - Metrics registry recording, single and multi-threaded
 * - No-op recorder cost
 * - Pool assessment and cooldown evaluation
 * - Query monitor wrapping overhead, enabled and disabled
 */

#include <benchmark/benchmark.h>

#include <chrono>
#include <memory>
#include <string>

#include <kcenon/resource_supervisor/core/capabilities.h>
#include <kcenon/resource_supervisor/metrics/metrics_recorder.h>
#include <kcenon/resource_supervisor/metrics/metrics_registry.h>
#include <kcenon/resource_supervisor/monitoring/pool_monitor.h>
#include <kcenon/resource_supervisor/monitoring/query_monitor.h>

using namespace resource_supervisor;

namespace
{

class static_pool : public core::monitorable
{
public:
	std::string name() const override { return "bench-db"; }
	core::pool_snapshot get_stats() const override { return snapshot; }

	core::pool_snapshot snapshot;
};

core::pool_snapshot busy_snapshot()
{
	core::pool_snapshot snapshot;
	snapshot.max_open = 100;
	snapshot.open = 92;
	snapshot.in_use = 90;
	snapshot.idle = 2;
	snapshot.wait_count = 14;
	snapshot.wait_duration = std::chrono::seconds(3);
	return snapshot;
}

} // namespace

// ============================================================================
// Recorder Benchmarks
// ============================================================================

static void BM_RegistryRecordQuery(benchmark::State& state)
{
	static metrics::metrics_registry registry;
	const std::chrono::nanoseconds latency(1500000);

	for (auto _ : state)
	{
		registry.record_query(latency, std::nullopt, std::chrono::seconds(1));
	}

	state.SetItemsProcessed(state.iterations());
	if (state.thread_index() == 0)
	{
		state.counters["queries_total"]
			= static_cast<double>(registry.queries().total.load());
	}
}
BENCHMARK(BM_RegistryRecordQuery)->Threads(1)->Threads(4)->UseRealTime();

static void BM_RegistryRecordPoolStats(benchmark::State& state)
{
	metrics::metrics_registry registry;
	const auto snapshot = busy_snapshot();

	for (auto _ : state)
	{
		registry.record_pool_stats(snapshot);
	}

	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RegistryRecordPoolStats);

static void BM_RegistryGetStatistics(benchmark::State& state)
{
	metrics::metrics_registry registry;
	registry.record_pool_stats(busy_snapshot());

	for (auto _ : state)
	{
		auto stats = registry.get_statistics();
		benchmark::DoNotOptimize(stats);
	}
}
BENCHMARK(BM_RegistryGetStatistics)->Unit(benchmark::kMicrosecond);

static void BM_NoopRecorder(benchmark::State& state)
{
	auto recorder = metrics::create_noop_recorder();
	const auto snapshot = busy_snapshot();

	for (auto _ : state)
	{
		recorder->record_pool_stats(snapshot);
		recorder->record_health_check(true);
		recorder->inc_connect_attempt();
	}

	state.SetItemsProcessed(state.iterations() * 3);
}
BENCHMARK(BM_NoopRecorder);

// ============================================================================
// Pool Monitor Benchmarks
// ============================================================================

static void BM_PoolAssess(benchmark::State& state)
{
	const auto snapshot = busy_snapshot();
	const monitoring::pool_thresholds thresholds;

	for (auto _ : state)
	{
		auto assessment = monitoring::pool_monitor::assess(snapshot, thresholds);
		benchmark::DoNotOptimize(assessment);
	}
}
BENCHMARK(BM_PoolAssess);

static void BM_PoolEvaluateSuppressed(benchmark::State& state)
{
	static_pool pool;
	core::supervisor_dependencies deps;
	deps.recorder = metrics::create_noop_recorder();

	auto created = monitoring::pool_monitor::create(&pool, {}, deps);
	if (created.is_err())
	{
		state.SkipWithError(created.error().message.c_str());
		return;
	}
	auto monitor = std::move(created.unwrap());

	const auto snapshot = busy_snapshot();
	const auto now = std::chrono::steady_clock::now();
	monitor->evaluate(snapshot, now);

	// Every further evaluation lands inside the cooldown window
	for (auto _ : state)
	{
		auto alert = monitor->evaluate(snapshot, now);
		benchmark::DoNotOptimize(alert);
	}

	state.counters["suppressed"] = static_cast<double>(monitor->alerts_suppressed());
}
BENCHMARK(BM_PoolEvaluateSuppressed);

// ============================================================================
// Query Monitor Benchmarks
// ============================================================================

static void BM_QueryMonitorOverhead(benchmark::State& state)
{
	core::supervisor_dependencies deps;
	deps.recorder = std::make_shared<metrics::metrics_registry>();

	monitoring::query_monitor_options options;
	options.enabled = state.range(0) != 0;
	monitoring::query_monitor monitor(options, deps);

	const std::string query = "SELECT * FROM orders WHERE id = $1";

	for (auto _ : state)
	{
		auto result = monitor.monitor(query, [] { return kcenon::common::Result<int>(1); });
		benchmark::DoNotOptimize(result);
	}

	state.SetLabel(options.enabled ? "enabled" : "disabled");
}
BENCHMARK(BM_QueryMonitorOverhead)->Arg(0)->Arg(1);

BENCHMARK_MAIN();
