// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "WorkQueue.hxx"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <stop_token>
#include <utility>

/**
 * A cancellation scope for tasks running on a #WorkQueue.  Every
 * subsystem (discovery, each controller) owns one; stopping a scope
 * affects only the tasks which were submitted through it.
 */
class TaskScope {
	WorkQueue &queue;

	const char *const name;

	struct State {
		std::mutex mutex;
		std::condition_variable cond;

		std::stop_source stop;

		/**
		 * Number of tasks submitted but not yet finished.
		 */
		unsigned n_pending = 0;
	};

	/**
	 * Shared with the submitted tasks, so a task which outlives this
	 * object (after a #CancelAndWait() timeout) does not access
	 * freed memory.
	 */
	const std::shared_ptr<State> state = std::make_shared<State>();

public:
	TaskScope(WorkQueue &_queue, const char *_name) noexcept
		:queue(_queue), name(_name) {}

	~TaskScope() noexcept {
		RequestStop();
	}

	TaskScope(const TaskScope &) = delete;
	TaskScope &operator=(const TaskScope &) = delete;

	const char *GetName() const noexcept {
		return name;
	}

	/**
	 * Submit a task.  It is invoked with a std::stop_token which
	 * gets signalled by RequestStop().
	 *
	 * @return false if the scope was stopped or the #WorkQueue is
	 * shutting down
	 */
	template<typename F>
	bool Submit(F &&f) noexcept {
		std::stop_token token;

		{
			const std::scoped_lock protect{state->mutex};
			if (state->stop.stop_requested())
				return false;

			token = state->stop.get_token();
			++state->n_pending;
		}

		if (!queue.Put([s=state, token, f=std::forward<F>(f)]() mutable {
			Invoke(*s, token, f);
		})) {
			Done(*state);
			return false;
		}

		return true;
	}

	[[gnu::pure]]
	bool IsStopRequested() const noexcept {
		const std::scoped_lock protect{state->mutex};
		return state->stop.stop_requested();
	}

	/**
	 * Signal all pending tasks to stop and reject new ones.  Does
	 * not wait.
	 */
	void RequestStop() noexcept;

	/**
	 * Wait until all submitted tasks have finished.
	 *
	 * @return false on timeout
	 */
	bool WaitIdle(std::chrono::steady_clock::duration timeout) noexcept;

	/**
	 * RequestStop() and WaitIdle().
	 */
	bool CancelAndWait(std::chrono::steady_clock::duration timeout) noexcept {
		RequestStop();
		return WaitIdle(timeout);
	}

	/**
	 * Allow new submissions after RequestStop().
	 */
	void Restart() noexcept;

	/**
	 * A cancellable delay for use inside tasks.
	 *
	 * @return false if the delay was interrupted by a stop request
	 */
	static bool SleepFor(std::stop_token token,
			     std::chrono::steady_clock::duration duration) noexcept;

private:
	template<typename F>
	static void Invoke(State &s, std::stop_token token, F &f) noexcept {
		try {
			if (!token.stop_requested())
				f(token);
		} catch (...) {
			LogTaskError(std::current_exception());
		}

		Done(s);
	}

	static void LogTaskError(std::exception_ptr ep) noexcept;

	static void Done(State &s) noexcept;
};
