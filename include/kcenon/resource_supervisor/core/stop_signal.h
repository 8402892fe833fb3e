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
 * @file stop_signal.h
 * @brief One-shot stop flag with an interruptible wait
 *
 * Used by the periodic worker between ticks and by startup retry between
 * backoff delays. A signal is held through a shared_ptr so a cancellation
 * token callback stays valid even if it fires after the waiter is gone.
 *
 * @code
 * auto signal = core::stop_signal::linked_to(token);
 * if (!signal->wait_for(std::chrono::seconds(2)))
 * {
 *     // token cancelled before the delay elapsed
 * }
 * @endcode
 */

#pragma once

#include <kcenon/thread/core/cancellation_token.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace resource_supervisor::core
{

/**
 * @struct stop_signal
 * @brief Flag that wakes every waiter once set
 */
struct stop_signal
{
	std::mutex mutex;
	std::condition_variable cv;
	bool stopped{ false };

	/**
	 * @brief Create a signal that is requested when @p token is cancelled
	 *
	 * A token that is already cancelled yields a signal that is already set.
	 */
	static std::shared_ptr<stop_signal> linked_to(kcenon::thread::cancellation_token& token);

	/**
	 * @brief Set the flag and wake all waiters
	 * @return true for the call that actually set the flag
	 */
	bool request();

	/**
	 * @brief Wait for @p duration unless stopped first
	 * @return true when the full duration elapsed without a stop
	 */
	bool wait_for(std::chrono::milliseconds duration);

	[[nodiscard]] bool is_requested();
};

} // namespace resource_supervisor::core
