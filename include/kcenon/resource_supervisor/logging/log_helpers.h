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
 * @file log_helpers.h
 * @brief Formatting and write helpers shared by all supervisors
 */

#pragma once

#include <kcenon/resource_supervisor/core/pool_snapshot.h>

#include <kcenon/common/interfaces/logger_interface.h>

#include <chrono>
#include <memory>
#include <string>

namespace resource_supervisor::logging
{

/**
 * @brief Write one line through an ILogger
 *
 * Skips the call when the level is disabled. When the logger is null,
 * reports a write error or throws a std::exception, the line goes to
 * stderr instead.
 *
 * @param logger Target logger (may be null)
 * @param level Severity of the line
 * @param message Fully formatted message
 */
void write_log(const std::shared_ptr<kcenon::common::interfaces::ILogger>& logger,
			   kcenon::common::interfaces::log_level level,
			   const std::string& message);

/**
 * @brief Render a duration in the shortest readable unit
 *
 * Examples: "0s", "750ns", "12.5us", "250ms", "6s", "1.5s".
 */
[[nodiscard]] std::string format_duration(std::chrono::nanoseconds duration);

/**
 * @brief Render the snapshot fields used in alert lines
 *
 * Format: "Open=18/20, InUse=18, Idle=0, WaitCount=3, WaitDuration=6s"
 */
[[nodiscard]] std::string format_snapshot(const core::pool_snapshot& snapshot);

} // namespace resource_supervisor::logging
