// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "Device.hxx"

/**
 * An interface that listens on events from #DeviceRegistry.
 *
 * The methods are invoked while the registry serializes its
 * mutations; they must not modify the registry or its listener list,
 * and they should return quickly.
 */
class RegistryListener {
public:
	virtual void OnDeviceAdded(const DevicePtr &device) noexcept = 0;

	/**
	 * A known device was announced again; its metadata may have
	 * changed.
	 */
	virtual void OnDeviceUpdated(const DevicePtr &device) noexcept = 0;

	virtual void OnDeviceRemoved(const DevicePtr &device) noexcept = 0;

	/**
	 * Emitted after every mutation with a snapshot of all devices.
	 */
	virtual void OnDeviceListUpdated(const DeviceList &devices) noexcept = 0;
};
