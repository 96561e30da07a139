// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <string_view>

enum class LogLevel {
	/**
	 * Debug message for developers, e.g. every SSDP packet.
	 */
	DEBUG,

	/**
	 * Unimportant informational message.
	 */
	INFO,

	/**
	 * Interesting informational message, e.g. a new renderer.
	 */
	NOTICE,

	/**
	 * Warning: something may be wrong.
	 */
	WARNING,

	/**
	 * An error has occurred, an operation could not finish
	 * successfully.
	 */
	ERROR,
};

/**
 * Parse a "log_level" setting.
 *
 * Throws #std::invalid_argument on error.
 */
LogLevel
ParseLogLevel(std::string_view value);
