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

#include <kcenon/resource_supervisor/core/periodic_worker.h>
#include <kcenon/resource_supervisor/core/error_codes.h>
#include <kcenon/resource_supervisor/logging/log_helpers.h>

#include <exception>

namespace resource_supervisor::core
{

using kcenon::common::interfaces::log_level;

/**
 * @brief Job that runs a worker's loop on an IExecutor
 */
class periodic_job : public kcenon::common::interfaces::IJob
{
public:
	periodic_job(periodic_worker* worker, std::shared_ptr<stop_signal> signal)
		: worker_(worker)
		, signal_(std::move(signal))
	{
	}

	kcenon::common::VoidResult execute() override
	{
		if (worker_)
		{
			worker_->run_loop(signal_);
		}
		return kcenon::common::ok();
	}

	std::string get_name() const override { return worker_ ? worker_->name() + "_loop" : "periodic_loop"; }
	int get_priority() const override { return 0; }

private:
	periodic_worker* worker_;
	std::shared_ptr<stop_signal> signal_;
};

periodic_worker::periodic_worker(std::string name,
								 std::chrono::milliseconds interval,
								 tick_function tick,
								 std::shared_ptr<kcenon::common::interfaces::ILogger> logger,
								 std::shared_ptr<kcenon::common::interfaces::IExecutor> executor)
	: name_(std::move(name))
	, interval_(interval)
	, tick_(std::move(tick))
	, logger_(std::move(logger))
	, executor_(std::move(executor))
{
}

periodic_worker::~periodic_worker()
{
	stop();

	// The loop references this object, so it must be gone before we are.
	std::lock_guard<std::mutex> lock(lifecycle_mutex_);
	if (loop_future_.valid())
	{
		loop_future_.wait();
	}
}

kcenon::common::VoidResult periodic_worker::start()
{
	std::lock_guard<std::mutex> lock(lifecycle_mutex_);
	return launch(std::make_shared<stop_signal>());
}

kcenon::common::VoidResult periodic_worker::start(kcenon::thread::cancellation_token token)
{
	std::lock_guard<std::mutex> lock(lifecycle_mutex_);

	if (token.is_cancelled())
	{
		return kcenon::common::error_info{
			error_codes::worker_stopped,
			"Cancellation token already cancelled for " + name_,
			"periodic_worker"
		};
	}

	auto signal = std::make_shared<stop_signal>();
	auto result = launch(signal);
	if (result.is_err())
	{
		return result;
	}

	token.register_callback([signal] { signal->request(); });
	return kcenon::common::ok();
}

kcenon::common::VoidResult periodic_worker::launch(std::shared_ptr<stop_signal> signal)
{
	if (interval_.count() <= 0)
	{
		return kcenon::common::error_info{
			error_codes::invalid_interval,
			"Interval must be greater than 0 for " + name_,
			"periodic_worker"
		};
	}

	if (!tick_)
	{
		return kcenon::common::error_info{
			error_codes::invalid_configuration,
			"No tick function for " + name_,
			"periodic_worker"
		};
	}

	if (running_.load())
	{
		return kcenon::common::error_info{
			error_codes::worker_already_started,
			name_ + " is already running",
			"periodic_worker"
		};
	}

	if (loop_future_.valid()
		&& loop_future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
	{
		return kcenon::common::error_info{
			error_codes::worker_already_started,
			name_ + " is still draining its previous loop",
			"periodic_worker"
		};
	}

	signal_ = signal;
	running_.store(true);

	if (executor_)
	{
		auto job = std::make_unique<periodic_job>(this, signal);
		auto result = executor_->execute(std::move(job));
		if (result.is_err())
		{
			running_.store(false);
			signal_.reset();
			return kcenon::common::error_info{
				error_codes::executor_rejected,
				"Executor rejected " + name_ + ": " + result.error().message,
				"periodic_worker"
			};
		}
		loop_future_ = std::move(result.unwrap());
	}
	else
	{
		loop_future_ = std::async(std::launch::async, [this, signal] { run_loop(signal); });
	}

	logging::write_log(logger_, log_level::debug,
					   name_ + " started (interval=" + logging::format_duration(interval_) + ")");
	return kcenon::common::ok();
}

void periodic_worker::stop()
{
	std::lock_guard<std::mutex> lock(lifecycle_mutex_);

	if (signal_)
	{
		signal_->request();
	}

	if (!running_.exchange(false))
	{
		return;
	}

	join(stop_timeout);
	logging::write_log(logger_, log_level::debug, name_ + " stopped");
}

void periodic_worker::join(std::chrono::seconds timeout)
{
	if (!loop_future_.valid())
	{
		return;
	}

	auto status = loop_future_.wait_for(timeout);
	if (status == std::future_status::timeout)
	{
		logging::write_log(logger_, log_level::warning,
						   name_ + " did not stop within "
							   + logging::format_duration(timeout)
							   + ", continuing shutdown");
	}
}

void periodic_worker::run_loop(const std::shared_ptr<stop_signal>& signal)
{
	while (signal->wait_for(interval_))
	{
		run_tick();
	}
	running_.store(false);
}

void periodic_worker::run_tick()
{
	try
	{
		tick_();
	}
	catch (const std::exception& e)
	{
		logging::write_log(logger_, log_level::error,
						   name_ + " tick failed: " + e.what());
	}
	ticks_.fetch_add(1);
}

} // namespace resource_supervisor::core
