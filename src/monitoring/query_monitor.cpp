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

#include <kcenon/resource_supervisor/monitoring/query_monitor.h>
#include <kcenon/resource_supervisor/logging/log_helpers.h>

namespace resource_supervisor::monitoring
{

using kcenon::common::interfaces::log_level;

query_monitor::query_monitor(query_monitor_options options, core::supervisor_dependencies deps)
	: options_(options)
	, deps_(deps.resolved("query_monitor"))
{
}

void query_monitor::observe(const std::string& query,
							std::chrono::nanoseconds duration,
							const std::optional<kcenon::common::error_info>& error)
{
	deps_.recorder->record_query(duration, error, options_.slow_threshold);

	if (duration >= options_.slow_threshold)
	{
		logging::write_log(deps_.logger, log_level::warning,
						   "Slow query detected: duration=" + logging::format_duration(duration)
							   + ", query=" + query
							   + ", error=" + (error ? error->message : std::string("none")));
	}
}

void query_monitor::record_transaction(std::chrono::nanoseconds duration, bool committed)
{
	deps_.recorder->record_tx(duration, committed);
}

} // namespace resource_supervisor::monitoring
