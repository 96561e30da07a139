// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "WorkQueue.hxx"
#include "Name.hxx"
#include "Log.hxx"
#include "util/Domain.hxx"

static constexpr Domain work_queue_domain("work_queue");

WorkQueue::WorkQueue(const char *_name, unsigned n_workers)
	:name(_name)
{
	threads.reserve(n_workers);

	try {
		for (unsigned i = 0; i < n_workers; ++i)
			threads.emplace_back(Run, shared, i);
	} catch (...) {
		SetTerminateAndWait(std::chrono::seconds{1});
		throw;
	}
}

bool
WorkQueue::Put(Task task) noexcept
{
	{
		const std::scoped_lock protect{shared->mutex};
		if (!shared->ok)
			return false;

		shared->queue.emplace_back(std::move(task));
	}

	shared->worker_cond.notify_one();
	return true;
}

bool
WorkQueue::WaitIdle(std::chrono::steady_clock::duration timeout) noexcept
{
	std::unique_lock lock{shared->mutex};
	return shared->client_cond.wait_for(lock, timeout, [this]{
		return !shared->ok ||
			(shared->queue.empty() && shared->n_busy == 0);
	}) && shared->ok;
}

bool
WorkQueue::SetTerminateAndWait(std::chrono::steady_clock::duration timeout) noexcept
{
	if (threads.empty())
		/* already called */
		return true;

	bool all_exited;

	{
		std::unique_lock lock{shared->mutex};
		shared->ok = false;
		shared->queue.clear();
		shared->worker_cond.notify_all();

		all_exited = shared->client_cond.wait_for(lock, timeout, [this]{
			return shared->n_exited == threads.size();
		});
	}

	if (all_exited) {
		for (auto &t : threads)
			t.join();
	} else {
		FmtWarning(work_queue_domain,
			   "{}: detaching workers which did not finish in time",
			   name);

		for (auto &t : threads)
			t.detach();
	}

	threads.clear();
	return all_exited;
}

void
WorkQueue::Run(std::shared_ptr<Shared> shared, unsigned index) noexcept
{
	FmtThreadName("upnpcast:{}", index);

	std::unique_lock lock{shared->mutex};

	while (true) {
		shared->worker_cond.wait(lock, [&shared]{
			return !shared->ok || !shared->queue.empty();
		});

		if (!shared->ok)
			break;

		Task task = std::move(shared->queue.front());
		shared->queue.pop_front();
		++shared->n_busy;

		lock.unlock();

		try {
			task();
		} catch (...) {
			LogError(std::current_exception(),
				 "Unhandled exception in worker");
		}

		/* destroy the task (and whatever it captured) outside
		   of the lock */
		task = nullptr;

		lock.lock();
		--shared->n_busy;
		shared->client_cond.notify_all();
	}

	++shared->n_exited;
	shared->client_cond.notify_all();
}
