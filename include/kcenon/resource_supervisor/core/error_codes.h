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
 * @file error_codes.h
 * @brief Error codes reported through kcenon::common::error_info
 *
 * Codes are grouped by component so that the numeric value alone identifies
 * the subsystem that produced an error:
 * - -100 .. -199: configuration
 * - -200 .. -299: background workers
 * - -300 .. -399: resilience (health checker, auto reconnector, retry)
 * - -400 .. -499: monitoring (pool monitor, leak detector)
 */

#pragma once

namespace resource_supervisor::error_codes
{

// Configuration
constexpr int invalid_configuration = -100;
constexpr int invalid_setting_value = -101;

// Background workers
constexpr int worker_already_started = -200;
constexpr int worker_stopped = -201;
constexpr int executor_rejected = -202;

// Resilience
constexpr int null_target = -300;
constexpr int invalid_interval = -301;
constexpr int invalid_failure_threshold = -302;
constexpr int retry_exhausted = -303;
constexpr int retry_cancelled = -304;

// Monitoring
constexpr int invalid_thresholds = -400;

} // namespace resource_supervisor::error_codes
