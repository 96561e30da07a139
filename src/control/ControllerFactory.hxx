// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "device/RegistryListener.hxx"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

struct CastConfig;
class Controller;
class DeviceRegistry;
class HttpClient;
class WorkQueue;

/**
 * Creates and caches one #Controller per device UDN.  Listens on the
 * #DeviceRegistry and drops the controller of a device which
 * disappears.
 *
 * Lock order: the registry's mutation lock may be held while this
 * object's lock is taken, never the other way round.
 */
class ControllerFactory final : RegistryListener {
	DeviceRegistry &registry;
	HttpClient &http;
	WorkQueue &queue;

	const std::chrono::steady_clock::duration shutdown_timeout;

	mutable std::mutex mutex;

	std::map<std::string, std::shared_ptr<Controller>, std::less<>> controllers;

public:
	ControllerFactory(DeviceRegistry &_registry, HttpClient &_http,
			  WorkQueue &_queue, const CastConfig &config) noexcept;

	~ControllerFactory() noexcept;

	ControllerFactory(const ControllerFactory &) = delete;
	ControllerFactory &operator=(const ControllerFactory &) = delete;

	/**
	 * Return the controller for the given device, creating it if
	 * necessary.  Concurrent callers for the same UDN get the same
	 * instance.
	 *
	 * Throws #CastException (DEVICE) if the device has no
	 * AVTransport service.
	 */
	std::shared_ptr<Controller> GetController(const DevicePtr &device);

	/**
	 * Return the existing controller, or nullptr.
	 */
	[[gnu::pure]]
	std::shared_ptr<Controller> FindController(std::string_view udn) const noexcept;

	/**
	 * Look up a device in the registry by its UDN (the "USN" prefix
	 * of SSDP messages).
	 */
	[[gnu::pure]]
	DevicePtr GetDeviceByUSN(const std::string &udn) const noexcept;

	/**
	 * Remove the controller and release it.
	 *
	 * @return false if there was no controller for this UDN
	 */
	bool RemoveController(std::string_view udn) noexcept;

	/**
	 * Remove and release all controllers.
	 */
	void ClearAll() noexcept;

	[[gnu::pure]]
	std::size_t GetControllerCount() const noexcept {
		const std::scoped_lock protect{mutex};
		return controllers.size();
	}

private:
	/**
	 * Remove the controller from the map and cancel its tasks
	 * without waiting.
	 */
	void Detach(const std::string &udn) noexcept;

	/* virtual methods from class RegistryListener */
	void OnDeviceAdded(const DevicePtr &device) noexcept override;
	void OnDeviceUpdated(const DevicePtr &device) noexcept override;
	void OnDeviceRemoved(const DevicePtr &device) noexcept override;
	void OnDeviceListUpdated(const DeviceList &devices) noexcept override;
};
