// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <utility>

/**
 * The exclusive capability to receive multicast packets.  Some
 * platforms require an explicit grant (and drop multicast packets to
 * save power otherwise); the embedder implements this interface.
 */
class MulticastLock {
public:
	virtual ~MulticastLock() noexcept = default;

	/**
	 * @return false if the capability is not available
	 */
	virtual bool Acquire() noexcept = 0;

	virtual void Release() noexcept = 0;
};

/**
 * For platforms which need no grant, e.g. Linux.
 */
class NullMulticastLock final : public MulticastLock {
public:
	bool Acquire() noexcept override {
		return true;
	}

	void Release() noexcept override {}
};

/**
 * Holds a #MulticastLock while it exists.  If the lock could not be
 * acquired, the lease is empty.
 */
class MulticastLease {
	MulticastLock *lock;

public:
	explicit MulticastLease(MulticastLock &_lock) noexcept
		:lock(_lock.Acquire() ? &_lock : nullptr) {}

	MulticastLease(MulticastLease &&src) noexcept
		:lock(std::exchange(src.lock, nullptr)) {}

	~MulticastLease() noexcept {
		Release();
	}

	MulticastLease(const MulticastLease &) = delete;
	MulticastLease &operator=(const MulticastLease &) = delete;

	explicit operator bool() const noexcept {
		return lock != nullptr;
	}

	/**
	 * Release the lock early.  Idempotent.
	 */
	void Release() noexcept {
		if (lock != nullptr)
			std::exchange(lock, nullptr)->Release();
	}
};
