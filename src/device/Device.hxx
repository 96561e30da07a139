// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

/**
 * A service advertised in a device description.  All URLs are
 * absolute.
 */
struct DeviceService {
	std::string type;
	std::string id;
	std::string control_url;
	std::string event_sub_url;
	std::string scpd_url;
};

/**
 * A UPnP device as described by its description document.  The UDN
 * is the identity and cannot be changed after construction; a
 * refresh creates a new instance with the same UDN.
 */
class Device {
	std::string udn;

public:
	/**
	 * The URL of the description document.
	 */
	std::string location;

	std::string device_type;
	std::string friendly_name;
	std::string manufacturer;
	std::string model_name;
	std::string model_number;

	/**
	 * Base for relative URLs; if the document does not specify it,
	 * it is derived from #location.
	 */
	std::string url_base;

	std::vector<DeviceService> services;

	explicit Device(std::string _udn) noexcept
		:udn(std::move(_udn)) {}

	/**
	 * Move the contents of another instance which describes the
	 * same device, but with a different spelling of the UDN.
	 */
	Device(std::string _udn, Device &&src) noexcept
		:Device(std::move(src)) {
		udn = std::move(_udn);
	}

	const std::string &GetUdn() const noexcept {
		return udn;
	}

	/**
	 * Find a service by type, ignoring its version.
	 */
	[[gnu::pure]]
	const DeviceService *FindService(std::string_view type) const noexcept;

	[[gnu::pure]]
	const DeviceService *GetAVTransport() const noexcept;

	[[gnu::pure]]
	const DeviceService *GetRenderingControl() const noexcept;

	/**
	 * Is this a device we can control?
	 */
	[[gnu::pure]]
	bool IsMediaRenderer() const noexcept;

	/**
	 * The friendly name, or a fallback if the device did not
	 * provide one.
	 */
	[[gnu::pure]]
	std::string_view GetDisplayName() const noexcept;

	/**
	 * The "host[:port]" part of the location.
	 */
	[[gnu::pure]]
	std::string_view GetAddress() const noexcept;

	/**
	 * Compare everything but the identity.
	 */
	[[gnu::pure]]
	bool IsSameMetadata(const Device &other) const noexcept;
};

using DevicePtr = std::shared_ptr<const Device>;
using DeviceList = std::vector<DevicePtr>;
