// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <string_view>

enum class ConfigOption {
	LOG_LEVEL,
	LOG_TIMESTAMP,
	NETWORK_INTERFACE,
	SEARCH_TIMEOUT,
	SEARCH_MX,
	TOMBSTONE_GRACE,
	MAX_DEVICES,
	CONNECT_TIMEOUT,
	SOAP_TIMEOUT,
	DESCRIPTION_RETRIES,
	RETRY_DELAY,
	WORKER_THREADS,
	SHUTDOWN_TIMEOUT,
	USER_AGENT,

	/**
	 * This value is only used to determine the number of options.
	 * It must be the last one.
	 */
	MAX
};

/**
 * The name of the option in the configuration file, e.g.
 * "search_timeout".
 */
[[gnu::const]]
std::string_view
GetConfigOptionName(ConfigOption option) noexcept;

/**
 * @return #ConfigOption::MAX if not found
 */
[[gnu::pure]]
ConfigOption
ParseConfigOptionName(std::string_view name) noexcept;
