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

#include <kcenon/resource_supervisor/logging/log_helpers.h>

#include <exception>
#include <iostream>
#include <sstream>

namespace resource_supervisor::logging
{

namespace
{

std::string trim_decimal(double value)
{
	std::ostringstream oss;
	oss.setf(std::ios::fixed);
	oss.precision(3);
	oss << value;

	std::string text = oss.str();
	auto dot = text.find('.');
	if (dot != std::string::npos)
	{
		while (!text.empty() && text.back() == '0')
		{
			text.pop_back();
		}
		if (!text.empty() && text.back() == '.')
		{
			text.pop_back();
		}
	}
	return text;
}

} // namespace

void write_log(const std::shared_ptr<kcenon::common::interfaces::ILogger>& logger,
			   kcenon::common::interfaces::log_level level,
			   const std::string& message)
{
	if (!logger)
	{
		std::cerr << "[" << kcenon::common::interfaces::to_string(level) << "] "
				  << message << "\n";
		return;
	}

	if (!logger->is_enabled(level))
	{
		return;
	}

	try
	{
		auto result = logger->log(level, message);
		if (result.is_err())
		{
			std::cerr << "[" << kcenon::common::interfaces::to_string(level) << "] "
					  << message << " (logger error: " << result.error().message << ")\n";
		}
	}
	catch (const std::exception& e)
	{
		std::cerr << "[" << kcenon::common::interfaces::to_string(level) << "] "
				  << message << " (logger threw: " << e.what() << ")\n";
	}
}

std::string format_duration(std::chrono::nanoseconds duration)
{
	const auto ns = duration.count();
	if (ns == 0)
	{
		return "0s";
	}

	const auto magnitude = ns < 0 ? -ns : ns;
	const double value = static_cast<double>(ns);

	if (magnitude < 1000)
	{
		return std::to_string(ns) + "ns";
	}
	if (magnitude < 1000000)
	{
		return trim_decimal(value / 1e3) + "us";
	}
	if (magnitude < 1000000000)
	{
		return trim_decimal(value / 1e6) + "ms";
	}
	return trim_decimal(value / 1e9) + "s";
}

std::string format_snapshot(const core::pool_snapshot& snapshot)
{
	std::ostringstream oss;
	oss << "Open=" << snapshot.open << "/" << snapshot.max_open
		<< ", InUse=" << snapshot.in_use
		<< ", Idle=" << snapshot.idle
		<< ", WaitCount=" << snapshot.wait_count
		<< ", WaitDuration=" << format_duration(snapshot.wait_duration);
	return oss.str();
}

} // namespace resource_supervisor::logging
