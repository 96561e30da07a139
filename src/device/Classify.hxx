// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

class Device;

enum class DeviceKind {
	TV,

	/**
	 * A set-top box or streaming stick.
	 */
	BOX,

	OTHER,
};

/**
 * Guess the kind of device from its manufacturer and model name.
 */
[[gnu::pure]]
DeviceKind
ClassifyDevice(const Device &device) noexcept;

/**
 * Sort priority for device lists; higher is listed first.
 */
constexpr unsigned
GetDevicePriority(DeviceKind kind) noexcept
{
	switch (kind) {
	case DeviceKind::TV:
		return 100;

	case DeviceKind::BOX:
		return 80;

	case DeviceKind::OTHER:
		break;
	}

	return 60;
}
