// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "DeviceCache.hxx"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

class RegistryListener;

/**
 * The set of currently known devices.  Owns the add/update/remove
 * semantics and notifies #RegistryListener instances.  The storage
 * is the #DeviceCache passed to the constructor.
 *
 * All methods are thread-safe.  Mutations are serialized, so all
 * listeners observe the same event order; readers are never blocked
 * by listeners and never see a partially applied bulk update.
 */
class DeviceRegistry {
public:
	using Clock = DeviceCache::Clock;

	/**
	 * The "max-age" assumed if the advertisement did not specify
	 * one.
	 */
	static constexpr std::chrono::seconds DEFAULT_MAX_AGE{1800};

	/**
	 * Devices are expired this long after their "max-age" has
	 * elapsed.
	 */
	static constexpr std::chrono::seconds EXPIRY_GRACE{20};

private:
	DeviceCache &cache;

	/**
	 * Serializes mutations and notifications; protects #listeners.
	 */
	std::mutex mutation_mutex;

	std::vector<RegistryListener *> listeners;

public:
	explicit DeviceRegistry(DeviceCache &_cache) noexcept
		:cache(_cache) {}

	DeviceRegistry(const DeviceRegistry &) = delete;
	DeviceRegistry &operator=(const DeviceRegistry &) = delete;

	/**
	 * Register a listener.  Adding the same listener again has no
	 * effect.
	 */
	void AddListener(RegistryListener &listener) noexcept;

	/**
	 * Unregister a listener.  After this method returns, the
	 * listener will not be invoked anymore.  Removing a listener
	 * which is not registered is a no-op.
	 */
	void RemoveListener(RegistryListener &listener) noexcept;

	/**
	 * Insert a device or replace the metadata of the device with the
	 * same UDN.
	 *
	 * @return true if the device was new, false if an existing entry
	 * was updated
	 */
	bool AddDevice(DevicePtr device,
		       std::chrono::seconds max_age=DEFAULT_MAX_AGE) noexcept;

	/**
	 * @return true if the device was present and has been removed
	 */
	bool RemoveDevice(const Device &device) noexcept {
		return RemoveDeviceById(device.GetUdn());
	}

	bool RemoveDeviceById(const std::string &udn) noexcept;

	[[gnu::pure]]
	DevicePtr GetDeviceById(const std::string &udn) const noexcept {
		return cache.GetByUdn(udn);
	}

	[[gnu::pure]]
	DevicePtr GetDeviceByLocation(const std::string &location) const noexcept {
		return cache.GetByLocation(location);
	}

	/**
	 * Return a point-in-time snapshot.
	 */
	DeviceList GetAllDevices() const noexcept {
		return cache.GetAll();
	}

	[[gnu::pure]]
	std::size_t GetDeviceCount() const noexcept {
		return cache.GetSize();
	}

	[[gnu::pure]]
	bool IsTombstoned(const std::string &udn) const noexcept {
		return cache.IsTombstoned(udn);
	}

	/**
	 * Replace the whole device list.  Emits removals, then
	 * additions, then updates, and finally one list update.
	 */
	void UpdateDeviceList(const DeviceList &devices) noexcept;

	/**
	 * Remove all devices: emits #OnDeviceRemoved for each device,
	 * then one #OnDeviceListUpdated with an empty list.  Cleared
	 * devices are not tombstoned.
	 */
	void ClearDevices() noexcept;

	/**
	 * Refresh the freshness of a known device (e.g. after a repeated
	 * "alive" advertisement).  No events are emitted.
	 *
	 * @return false if the device is unknown
	 */
	bool Touch(const std::string &udn, std::chrono::seconds max_age) noexcept {
		return cache.Touch(udn, max_age);
	}

	/**
	 * Remove all devices which have not been refreshed within their
	 * "max-age" (plus #EXPIRY_GRACE).
	 *
	 * @return the number of removed devices
	 */
	unsigned ExpireDevices(Clock::time_point now=Clock::now()) noexcept;

private:
	void NotifyAdded(const DevicePtr &device) noexcept;
	void NotifyUpdated(const DevicePtr &device) noexcept;
	void NotifyRemoved(const DevicePtr &device) noexcept;
	void NotifyListUpdated() noexcept;

	/**
	 * Remove devices by UDN and emit events.  Caller must hold
	 * #mutation_mutex.
	 */
	unsigned RemoveLocked(const std::vector<std::string> &udns) noexcept;
};
