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
 * @file supervisor_dependencies.h
 * @brief Collaborators injected into every supervisor
 */

#pragma once

#include <kcenon/resource_supervisor/metrics/metrics_recorder.h>

#include <kcenon/common/interfaces/executor_interface.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <memory>
#include <string>

namespace resource_supervisor::core
{

/**
 * @struct supervisor_dependencies
 * @brief Logger, metrics sink and executor shared by a supervisor set
 *
 * Any member may be left null. resolved() fills the gaps:
 * - logger: a private console_logger tagged with the component name
 * - recorder: a noop_metrics_recorder
 * - executor: stays null, workers then run on std::async
 */
struct supervisor_dependencies
{
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger;
	std::shared_ptr<metrics::metrics_recorder> recorder;
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor;

	/**
	 * @brief Copy with null logger and recorder replaced by defaults
	 * @param component Tag for the fallback console logger
	 */
	[[nodiscard]] supervisor_dependencies resolved(const std::string& component) const;
};

} // namespace resource_supervisor::core
