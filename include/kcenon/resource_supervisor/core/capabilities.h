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
 * @file capabilities.h
 * @brief Capability interfaces implemented by supervised resources
 *
 * Supervisors never see the concrete driver handle or cache client. They
 * only depend on the minimal capability each of them needs:
 *
 * | Supervisor       | Capability                          |
 * |------------------|-------------------------------------|
 * | health_checker   | health_checkable (+ recoverable)    |
 * | auto_reconnector | recoverable                         |
 * | pool_monitor     | monitorable                         |
 * | leak_detector    | monitorable                         |
 *
 * Every capability derives virtually from named_resource so that a single
 * adapter can implement all of them with one name() override.
 *
 * Example:
 * @code
 * class postgres_adapter : public core::supervised_resource
 * {
 * public:
 *     std::string name() const override { return "orders-db"; }
 *     kcenon::common::VoidResult check_health() override { ... }
 *     kcenon::common::VoidResult reconnect() override { ... }
 *     bool is_connected() const override { ... }
 *     core::pool_snapshot get_stats() const override { ... }
 * };
 * @endcode
 */

#pragma once

#include "pool_snapshot.h"

#include <string>

#include <kcenon/common/patterns/result.h>

namespace resource_supervisor::core
{

/**
 * @class named_resource
 * @brief Display name shared by every capability
 */
class named_resource
{
public:
	virtual ~named_resource() = default;

	/**
	 * @brief Name used in log lines and alerts
	 */
	[[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @class health_checkable
 * @brief Resource whose liveness can be probed
 */
class health_checkable : public virtual named_resource
{
public:
	/**
	 * @brief Probe liveness (for example a "SELECT 1" round trip)
	 * @return ok() when alive, error otherwise
	 *
	 * May block on network I/O.
	 */
	virtual kcenon::common::VoidResult check_health() = 0;
};

/**
 * @class recoverable
 * @brief Resource that can re-establish its connections
 */
class recoverable : public virtual named_resource
{
public:
	/**
	 * @brief Tear down and re-open the underlying pool
	 * @return ok() when the resource is usable again
	 */
	virtual kcenon::common::VoidResult reconnect() = 0;

	/**
	 * @brief Whether the resource currently reports itself connected
	 */
	[[nodiscard]] virtual bool is_connected() const = 0;
};

/**
 * @class monitorable
 * @brief Resource that reports pool counters
 */
class monitorable : public virtual named_resource
{
public:
	/**
	 * @brief Take a snapshot of the pool counters
	 */
	[[nodiscard]] virtual pool_snapshot get_stats() const = 0;
};

/**
 * @class supervised_resource
 * @brief Convenience union of all capabilities for full pool owners
 */
class supervised_resource : public health_checkable, public recoverable, public monitorable
{
};

} // namespace resource_supervisor::core
