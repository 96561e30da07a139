// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <string_view>

/**
 * Coarse-grained classification of a failure.  The numeric values
 * are stable and are reported to clients as "error code".
 */
enum class ErrorCategory : unsigned {
	NETWORK = 1001,
	NETWORK_TIMEOUT = 1002,
	DISCOVERY = 1003,

	CONNECTION = 2001,
	DEVICE_CONNECTION = 2002,
	COMMUNICATION = 2003,
	DEVICE = 2004,

	PLAYBACK = 3001,
	CONTROL = 3002,

	INVALID_PARAMETER = 4001,
	RESOURCE = 4002,
	PARSING = 4003,

	SECURITY = 5001,

	COMPATIBILITY = 6001,

	UNKNOWN = 9999,
};

constexpr unsigned
GetErrorCode(ErrorCategory category) noexcept
{
	return unsigned(category);
}

[[gnu::const]]
std::string_view
ToString(ErrorCategory category) noexcept;
