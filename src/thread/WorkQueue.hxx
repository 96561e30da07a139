// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * A fixed pool of worker threads consuming a FIFO of tasks.  This is
 * shared by all subsystems; each of them submits its tasks through a
 * #TaskScope, which provides isolated cancellation.
 */
class WorkQueue {
public:
	using Task = std::function<void()>;

private:
	/**
	 * The state shared with the worker threads.  It is reference
	 * counted so a worker which was detached during shutdown (because
	 * its task did not return in time) can still access it safely.
	 */
	struct Shared {
		std::mutex mutex;

		/**
		 * Signalled when a task was added or when shutting down.
		 */
		std::condition_variable worker_cond;

		/**
		 * Signalled when a worker goes idle or exits.
		 */
		std::condition_variable client_cond;

		std::deque<Task> queue;

		unsigned n_busy = 0, n_exited = 0;

		bool ok = true;
	};

	const std::string name;

	const std::shared_ptr<Shared> shared = std::make_shared<Shared>();

	std::vector<std::thread> threads;

public:
	/**
	 * Start the worker threads.
	 *
	 * Throws on error.
	 */
	WorkQueue(const char *_name, unsigned n_workers);

	~WorkQueue() noexcept {
		SetTerminateAndWait(std::chrono::seconds{5});
	}

	WorkQueue(const WorkQueue &) = delete;
	WorkQueue &operator=(const WorkQueue &) = delete;

	const std::string &GetName() const noexcept {
		return name;
	}

	/**
	 * Add a task to the queue.  Returns false if the queue is
	 * shutting down (the task is destroyed without being run).
	 */
	bool Put(Task task) noexcept;

	/**
	 * Wait until the queue is empty and all workers are idle.
	 *
	 * @return false on timeout or if the queue is shutting down
	 */
	bool WaitIdle(std::chrono::steady_clock::duration timeout) noexcept;

	/**
	 * Tell the workers to exit and wait for them.  Pending tasks are
	 * discarded.  Workers which are still busy when the timeout
	 * expires are detached, so a stuck task cannot block teardown.
	 * May be called multiple times.
	 *
	 * @return true if all workers have exited
	 */
	bool SetTerminateAndWait(std::chrono::steady_clock::duration timeout) noexcept;

private:
	static void Run(std::shared_ptr<Shared> shared,
			unsigned index) noexcept;
};
