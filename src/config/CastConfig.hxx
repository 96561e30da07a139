// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <chrono>
#include <string>

struct ConfigData;

/**
 * Typed settings for the whole control point, loaded from
 * #ConfigData.  The defaults apply when no configuration file is
 * used.
 */
struct CastConfig {
	/**
	 * The interface libupnp binds to; empty means "any".
	 */
	std::string network_interface;

	std::string user_agent;

	std::chrono::steady_clock::duration search_timeout = std::chrono::seconds{30};

	/**
	 * The "MX" value of M-SEARCH requests: renderers delay their
	 * response randomly by up to this many seconds.
	 */
	std::chrono::seconds search_mx{3};

	std::chrono::steady_clock::duration tombstone_grace = std::chrono::seconds{10};

	std::chrono::steady_clock::duration connect_timeout = std::chrono::seconds{10};
	std::chrono::steady_clock::duration soap_timeout = std::chrono::seconds{30};

	/**
	 * Delay between a failed device lookup and the retry.
	 */
	std::chrono::steady_clock::duration retry_delay = std::chrono::seconds{2};

	std::chrono::steady_clock::duration shutdown_timeout = std::chrono::seconds{5};

	unsigned max_devices = 100;

	unsigned description_retries = 3;

	unsigned worker_threads = 4;

	CastConfig();

	/**
	 * Throws on error.
	 */
	explicit CastConfig(const ConfigData &config);
};

/**
 * Apply the "log_level" and "log_timestamp" settings.
 *
 * Throws on error.
 */
void
ConfigureLogging(const ConfigData &config, bool verbose);
