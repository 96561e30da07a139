// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "Device.hxx"

#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * Keyed storage for discovered devices, indexed by UDN and by
 * description location.  Removed devices leave a "tombstone" for a
 * grace period, so "recently removed" can be told apart from "never
 * seen".  All methods are thread-safe; each one is atomic.
 */
class DeviceCache {
public:
	using Clock = std::chrono::steady_clock;

	struct Upsert {
		DevicePtr device;

		/**
		 * The "max-age" of the advertisement which announced the
		 * device.
		 */
		std::chrono::seconds max_age;
	};

	/**
	 * A set of modifications to be applied atomically.  Removals
	 * are applied before upserts.
	 */
	struct Batch {
		std::vector<std::string> removals;
		std::vector<Upsert> upserts;

		/**
		 * Leave tombstones for removed devices?
		 */
		bool tombstone = true;
	};

private:
	struct Entry {
		DevicePtr device;

		Clock::time_point last_seen;

		std::chrono::seconds max_age;
	};

	mutable std::mutex mutex;

	std::unordered_map<std::string, Entry> by_udn;

	/**
	 * Maps the description location to the UDN.
	 */
	std::unordered_map<std::string, std::string> by_location;

	/**
	 * Maps the UDN of a removed device to the time of removal.
	 */
	std::unordered_map<std::string, Clock::time_point> tombstones;

	const std::size_t capacity;

	const Clock::duration tombstone_grace;

public:
	DeviceCache(std::size_t _capacity,
		    Clock::duration _tombstone_grace) noexcept
		:capacity(_capacity), tombstone_grace(_tombstone_grace) {}

	DeviceCache(const DeviceCache &) = delete;
	DeviceCache &operator=(const DeviceCache &) = delete;

	[[gnu::pure]]
	DevicePtr GetByUdn(const std::string &udn) const noexcept;

	[[gnu::pure]]
	DevicePtr GetByLocation(const std::string &location) const noexcept;

	/**
	 * Return a point-in-time copy of all live devices, sorted by
	 * UDN.
	 */
	DeviceList GetAll() const noexcept;

	[[gnu::pure]]
	std::size_t GetSize() const noexcept;

	/**
	 * Was the device removed less than "tombstone_grace" ago?
	 */
	[[gnu::pure]]
	bool IsTombstoned(const std::string &udn,
			  Clock::time_point now=Clock::now()) const noexcept;

	/**
	 * Apply all modifications of the batch under one lock.
	 *
	 * @return devices which had to be evicted to honor the
	 * capacity limit
	 */
	DeviceList Apply(const Batch &batch,
			 Clock::time_point now=Clock::now()) noexcept;

	/**
	 * Update the freshness of a device without changing its
	 * metadata.
	 *
	 * @return false if the device is not present
	 */
	bool Touch(const std::string &udn, std::chrono::seconds max_age,
		   Clock::time_point now=Clock::now()) noexcept;

	/**
	 * Return the UDNs of all devices which have not been seen for
	 * longer than their "max-age" plus the given grace period.
	 */
	std::vector<std::string> CollectExpired(Clock::time_point now,
						Clock::duration grace) const noexcept;

	/**
	 * Remove everything, including tombstones.
	 */
	void Clear() noexcept;

private:
	void EraseLocked(const std::string &udn, bool tombstone,
			 Clock::time_point now) noexcept;

	void PurgeTombstonesLocked(Clock::time_point now) noexcept;

	/**
	 * Evict the least recently seen device.
	 */
	DevicePtr EvictLocked() noexcept;
};
