// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "SsdpClient.hxx"
#include "thread/TaskScope.hxx"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>

struct CastConfig;
struct CastError;
class MulticastLock;
class MulticastLease;
class DeviceRegistry;
class DiscoveryObserver;
class HttpClient;
class WorkQueue;

/**
 * The discovery engine: sends SSDP searches, receives responses and
 * advertisements, downloads device descriptions and feeds the
 * #DeviceRegistry.
 *
 * At most one search is in flight at a time.  While it runs, it holds
 * a #MulticastLease.
 */
class Router final : SsdpHandler {
	using Clock = std::chrono::steady_clock;

	SsdpClient &client;
	MulticastLock &multicast_lock;
	DeviceRegistry &registry;
	HttpClient &http;

	DiscoveryObserver *observer = nullptr;

	const Clock::duration default_timeout;
	const std::chrono::seconds mx;
	const unsigned description_retries;

	/**
	 * All tasks of the discovery engine: the listening task and the
	 * description downloads.
	 */
	TaskScope scope;

	mutable std::mutex mutex;

	/**
	 * Signalled when #stop_search is set or when the search
	 * finishes.
	 */
	std::condition_variable_any cond;

	/**
	 * Has the #SsdpClient been opened?
	 */
	bool running = false;

	/**
	 * Is a listening task in flight?
	 */
	bool searching = false;

	/**
	 * Set by StopSearch() to wake up the listening task.
	 */
	bool stop_search = false;

	/**
	 * UDNs of devices whose description is being downloaded.
	 */
	std::set<std::string> pending_fetches;

	/**
	 * UDNs of devices which turned out not to be renderers.
	 */
	std::set<std::string> ignored;

public:
	Router(SsdpClient &_client, MulticastLock &_multicast_lock,
	       DeviceRegistry &_registry, HttpClient &_http,
	       WorkQueue &queue, const CastConfig &config) noexcept;

	~Router() noexcept {
		Shutdown();
	}

	Router(const Router &) = delete;
	Router &operator=(const Router &) = delete;

	void SetObserver(DiscoveryObserver *_observer) noexcept {
		observer = _observer;
	}

	/**
	 * Open the SSDP transport.  Does nothing if it is already open.
	 *
	 * Throws #CastException (DISCOVERY) on error.
	 */
	void Startup();

	/**
	 * Stop the search, cancel all downloads and close the SSDP
	 * transport.  May be called multiple times.
	 */
	void Shutdown() noexcept;

	[[gnu::pure]]
	bool IsRunning() const noexcept {
		const std::scoped_lock protect{mutex};
		return running;
	}

	[[gnu::pure]]
	bool IsSearching() const noexcept {
		const std::scoped_lock protect{mutex};
		return searching;
	}

	/**
	 * Start a search with the configured timeout.
	 *
	 * @see Search(Clock::duration)
	 */
	bool Search() noexcept {
		return Search(default_timeout);
	}

	/**
	 * Start a search (if none is in flight) and return immediately.
	 * Responses are collected until the timeout expires or
	 * StopSearch() is called.  Errors are reported to the
	 * #DiscoveryObserver.
	 *
	 * @return true if a search is in flight now
	 */
	bool Search(Clock::duration timeout) noexcept;

	/**
	 * Cancel the search and release the multicast lock.  No-op if
	 * no search is in flight.
	 */
	void StopSearch() noexcept;

	/**
	 * Wait until the current search (if any) has finished.
	 *
	 * @return false on timeout
	 */
	bool WaitSearchFinished(Clock::duration timeout) noexcept;

	/**
	 * Wait until all description downloads have finished.
	 *
	 * @return false on timeout
	 */
	bool WaitIdle(Clock::duration timeout) noexcept;

private:
	void RunSearch(MulticastLease &lease, Clock::duration timeout,
		       std::stop_token token) noexcept;

	void FinishSearch(MulticastLease &lease) noexcept;

	void FetchDescription(const std::string &udn,
			      const std::string &location,
			      std::chrono::seconds max_age,
			      std::stop_token token) noexcept;

	void ReportError(const CastError &error) noexcept;

	void OnAlive(const SsdpMessage &message) noexcept;

	/* virtual methods from class SsdpHandler */
	void OnSsdpMessage(const SsdpMessage &message) noexcept override;
};
