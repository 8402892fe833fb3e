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

#include <kcenon/resource_supervisor/metrics/metrics_registry.h>

#include <algorithm>

namespace resource_supervisor::metrics
{

namespace
{

uint64_t to_ns(std::chrono::nanoseconds duration)
{
	return duration.count() > 0 ? static_cast<uint64_t>(duration.count()) : 0;
}

double load_double(const std::atomic<int64_t>& value)
{
	return static_cast<double>(value.load(std::memory_order_relaxed));
}

double load_double(const std::atomic<uint64_t>& value)
{
	return static_cast<double>(value.load(std::memory_order_relaxed));
}

} // namespace

metrics_config metrics_config::default_config()
{
	return metrics_config{};
}

bool metrics_config::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> metrics_config::validation_errors() const
{
	std::vector<std::string> errors;

	if (enabled && ns.empty() && subsystem.empty())
	{
		errors.push_back("Metrics namespace and subsystem cannot both be empty");
	}

	if (slow_query_threshold.count() <= 0)
	{
		errors.push_back("Slow query threshold must be greater than 0");
	}

	for (const auto& [key, value] : labels)
	{
		if (key.empty())
		{
			errors.push_back("Metric label names cannot be empty");
			break;
		}
	}

	return errors;
}

metrics_registry::metrics_registry(metrics_config config)
	: config_(std::move(config))
{
}

void metrics_registry::record_pool_stats(const core::pool_snapshot& snapshot)
{
	if (!config_.enabled)
	{
		return;
	}
	pool_.store(snapshot);
}

void metrics_registry::record_health_check(bool success)
{
	if (!config_.enabled)
	{
		return;
	}
	health_.record(success);
}

void metrics_registry::record_query(std::chrono::nanoseconds duration,
									const std::optional<kcenon::common::error_info>& error,
									std::chrono::nanoseconds slow_threshold)
{
	if (!config_.enabled)
	{
		return;
	}

	const auto threshold
		= slow_threshold.count() > 0 ? slow_threshold : config_.slow_query_threshold;
	const bool is_slow = threshold.count() > 0 && duration >= threshold;

	queries_.record(to_ns(duration), error.has_value(), is_slow);
}

void metrics_registry::record_tx(std::chrono::nanoseconds duration, bool committed)
{
	if (!config_.enabled)
	{
		return;
	}
	transactions_.record(to_ns(duration), committed);
}

void metrics_registry::inc_connect_attempt()
{
	if (config_.enabled)
	{
		connects_.attempts.fetch_add(1, std::memory_order_relaxed);
	}
}

void metrics_registry::inc_connect_retry()
{
	if (config_.enabled)
	{
		connects_.retries.fetch_add(1, std::memory_order_relaxed);
	}
}

void metrics_registry::inc_connect_success()
{
	if (config_.enabled)
	{
		connects_.successes.fetch_add(1, std::memory_order_relaxed);
	}
}

void metrics_registry::inc_connect_failure()
{
	if (config_.enabled)
	{
		connects_.failures.fetch_add(1, std::memory_order_relaxed);
	}
}

stats_map metrics_registry::get_statistics() const
{
	stats_map stats;

	stats["enabled"] = config_.enabled ? 1.0 : 0.0;

	// Pool gauges
	stats["max_open_connections"] = load_double(pool_.max_open);
	stats["open_connections"] = load_double(pool_.open);
	stats["in_use_connections"] = load_double(pool_.in_use);
	stats["idle_connections"] = load_double(pool_.idle);
	stats["max_idle_connections"] = load_double(pool_.max_idle);
	stats["wait_count_total"] = load_double(pool_.wait_count);
	stats["wait_duration_seconds_total"]
		= detail::ns_to_seconds(static_cast<uint64_t>(
			std::max<int64_t>(pool_.wait_duration_ns.load(std::memory_order_relaxed), 0)));
	stats["max_idle_closed_total"] = load_double(pool_.idle_closed);
	stats["max_lifetime_closed_total"] = load_double(pool_.lifetime_closed);

	// Health checks
	stats["health_check_total"] = load_double(health_.total);
	stats["health_check_success_total"] = load_double(health_.success);
	stats["health_check_failure_total"] = load_double(health_.failure);

	// Queries and transactions
	stats["queries_total"] = load_double(queries_.total);
	stats["errors_total"] = load_double(queries_.errors);
	stats["slow_queries_total"] = load_double(queries_.slow);
	stats["query_duration_seconds_sum"]
		= detail::ns_to_seconds(queries_.total_latency_ns.load(std::memory_order_relaxed));
	stats["query_latency_avg_ms"] = queries_.avg_latency_ms();
	stats["query_latency_min_ms"] = static_cast<double>(queries_.min_latency()) / 1000000.0;
	stats["query_latency_max_ms"]
		= static_cast<double>(queries_.max_latency_ns.load(std::memory_order_relaxed)) / 1000000.0;
	stats["tx_commit_total"] = load_double(transactions_.commits);
	stats["tx_rollback_total"] = load_double(transactions_.rollbacks);
	stats["tx_duration_seconds_sum"] = detail::ns_to_seconds(
		transactions_.commit_duration_ns.load(std::memory_order_relaxed)
		+ transactions_.rollback_duration_ns.load(std::memory_order_relaxed));

	// Connects
	stats["connect_attempts_total"] = load_double(connects_.attempts);
	stats["connect_retries_total"] = load_double(connects_.retries);
	stats["connect_success_total"] = load_double(connects_.successes);
	stats["connect_failures_total"] = load_double(connects_.failures);

	return stats;
}

std::vector<exported_metric> metrics_registry::export_metrics() const
{
	std::vector<exported_metric> exported;
	if (!config_.enabled)
	{
		return exported;
	}

	const auto now = std::chrono::system_clock::now();
	const auto stats = get_statistics();

	exported.reserve(stats.size());
	for (const auto& [name, value] : stats)
	{
		if (name == "enabled")
		{
			continue;
		}
		exported.push_back({ metric_name(name), value, now, config_.labels });
	}

	return exported;
}

void metrics_registry::reset()
{
	pool_.reset();
	health_.reset();
	queries_.reset();
	transactions_.reset();
	connects_.reset();
}

std::string metrics_registry::metric_name(std::string_view metric) const
{
	std::string name;
	if (!config_.ns.empty())
	{
		name += config_.ns;
		name += '_';
	}
	if (!config_.subsystem.empty())
	{
		name += config_.subsystem;
		name += '_';
	}
	name += metric;
	return name;
}

} // namespace resource_supervisor::metrics
