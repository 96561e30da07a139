// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "config/CastConfig.hxx"
#include "control/ControllerFactory.hxx"
#include "control/MediaAction.hxx"
#include "control/TransportState.hxx"
#include "device/DeviceCache.hxx"
#include "device/DeviceRegistry.hxx"
#include "discovery/Observer.hxx"
#include "discovery/Router.hxx"
#include "thread/TaskScope.hxx"
#include "thread/WorkQueue.hxx"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

class SsdpClient;
class HttpClient;
class MulticastLock;
class Controller;

/**
 * A snapshot of a device for presentation.
 */
struct DeviceInfo {
	std::string udn;
	std::string name;

	/**
	 * The "host[:port]" of the device.
	 */
	std::string address;

	bool is_tv = false;

	unsigned priority = 0;
};

/**
 * The result of Instance::GetState().
 */
struct CastStatus {
	bool connected = false;

	std::optional<DeviceInfo> device;

	TransportState state = TransportState::IDLE;

	std::optional<unsigned> volume;
	std::optional<bool> muted;
};

/**
 * The top-level context: owns all managers of the control point and
 * provides the operations a front end needs.  The network backends
 * are injected.
 */
class Instance final : DiscoveryObserver {
public:
	using Clock = std::chrono::steady_clock;

	/**
	 * Receives the result of an asynchronous operation; failures
	 * have the key "Error".
	 */
	using Callback = std::function<void(ActionResult &&result)>;

private:
	const CastConfig config;

	WorkQueue queue;

	DeviceCache cache;
	DeviceRegistry registry;

	ControllerFactory factory;

	Router router;

	/**
	 * Tasks submitted by Cast() and Control().
	 */
	TaskScope scope;

	DiscoveryObserver *observer = nullptr;

	mutable std::mutex mutex;

	/**
	 * The UDN of the device selected by the last Cast() call.
	 */
	std::string current_udn;

	bool released = false;

public:
	/**
	 * Throws on error.
	 */
	Instance(const CastConfig &_config, SsdpClient &ssdp,
		 HttpClient &http, MulticastLock &multicast_lock);

	~Instance() noexcept {
		Release();
	}

	Instance(const Instance &) = delete;
	Instance &operator=(const Instance &) = delete;

	const CastConfig &GetConfig() const noexcept {
		return config;
	}

	DeviceRegistry &GetRegistry() noexcept {
		return registry;
	}

	ControllerFactory &GetControllerFactory() noexcept {
		return factory;
	}

	Router &GetRouter() noexcept {
		return router;
	}

	/**
	 * Forward discovery events to this observer.  Must be called
	 * before the first search.
	 */
	void SetObserver(DiscoveryObserver *_observer) noexcept {
		observer = _observer;
	}

	/**
	 * Return all known devices, TVs first, then by name.
	 */
	std::vector<DeviceInfo> GetDevices() const noexcept;

	/**
	 * @see Router::Search()
	 */
	bool Search() noexcept {
		return router.Search();
	}

	bool Search(Clock::duration timeout) noexcept {
		return router.Search(timeout);
	}

	void StopSearch() noexcept {
		router.StopSearch();
	}

	/**
	 * Make the given device the current one, the target of
	 * Control().
	 */
	void SetCurrentDevice(std::string udn) noexcept {
		const std::scoped_lock protect{mutex};
		current_udn = std::move(udn);
	}

	/**
	 * Make the given device the current one and play a media URL on
	 * it.  This runs asynchronously; the callback receives the
	 * result.
	 *
	 * @return false if the instance has been released (the callback
	 * will not be invoked)
	 */
	bool Cast(std::string udn, std::string url, std::string title,
		  Callback callback,
		  std::chrono::milliseconds start_position={}) noexcept;

	/**
	 * Execute an action on the current device asynchronously.  The
	 * value is the action's main input: the volume for SET_VOLUME,
	 * the mute flag for SET_MUTE, the target (milliseconds or
	 * "H+:MM:SS") for SEEK.
	 *
	 * @return false if the instance has been released (the callback
	 * will not be invoked)
	 */
	bool Control(MediaAction action, std::string value,
		     Callback callback) noexcept;

	/**
	 * Return the current state without network I/O.
	 */
	CastStatus GetState() const noexcept;

	/**
	 * Stop discovery, drop all controllers, cancel all tasks and
	 * shut down the worker threads.  May be called multiple times.
	 */
	void Release() noexcept;

private:
	std::string GetCurrentUdn() const noexcept {
		const std::scoped_lock protect{mutex};
		return current_udn;
	}

	/**
	 * Look up a device.  If it is not known, start a search, wait
	 * for the configured retry delay and try again.
	 *
	 * Throws #CastException (DEVICE_CONNECTION if the device has
	 * disappeared recently, INVALID_PARAMETER otherwise).
	 */
	DevicePtr ResolveDevice(const std::string &udn, std::stop_token token);

	void DoCast(const std::string &udn, const std::string &url,
		    const std::string &title,
		    std::chrono::milliseconds start_position,
		    const Callback &callback, std::stop_token token) noexcept;

	void DoControl(MediaAction action, const std::string &value,
		       const Callback &callback, std::stop_token token) noexcept;

	/* virtual methods from class DiscoveryObserver */
	void OnSearchStarted() noexcept override;
	void OnSearchFinished() noexcept override;
	void OnDiscoveryError(const CastError &error) noexcept override;
};

/**
 * Convert a #Device to a #DeviceInfo.
 */
DeviceInfo
MakeDeviceInfo(const Device &device) noexcept;

/**
 * Build the inputs for an action from a single value, see
 * Instance::Control().
 *
 * Throws #CastException (INVALID_PARAMETER) if the value is not
 * valid for the action.
 */
ActionInputs
MakeActionInputs(MediaAction action, std::string_view value);
