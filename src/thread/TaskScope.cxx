// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "TaskScope.hxx"
#include "Log.hxx"

#include <condition_variable>

void
TaskScope::RequestStop() noexcept
{
	const std::scoped_lock protect{state->mutex};
	state->stop.request_stop();
}

bool
TaskScope::WaitIdle(std::chrono::steady_clock::duration timeout) noexcept
{
	std::unique_lock lock{state->mutex};
	return state->cond.wait_for(lock, timeout, [this]{
		return state->n_pending == 0;
	});
}

void
TaskScope::Restart() noexcept
{
	const std::scoped_lock protect{state->mutex};
	if (state->stop.stop_requested())
		state->stop = {};
}

bool
TaskScope::SleepFor(std::stop_token token,
		    std::chrono::steady_clock::duration duration) noexcept
{
	std::mutex mutex;
	std::condition_variable_any cond;

	std::unique_lock lock{mutex};
	cond.wait_for(lock, token, duration, []{ return false; });
	return !token.stop_requested();
}

void
TaskScope::LogTaskError(std::exception_ptr ep) noexcept
{
	LogError(ep, "Task failed");
}

void
TaskScope::Done(State &s) noexcept
{
	const std::scoped_lock protect{s.mutex};
	--s.n_pending;
	s.cond.notify_all();
}
