// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

/**
 * Format a duration in the UPnP "H+:MM:SS" format with at least two
 * digits for the hours, e.g. "01:02:03".  Fractions are truncated.
 */
std::string
FormatUpnpTime(std::chrono::milliseconds t) noexcept;

/**
 * Parse a time in the format "H+:MM:SS[.F+]" or "MM:SS".
 *
 * @return std::nullopt if the string is malformed or is
 * "NOT_IMPLEMENTED"
 */
[[gnu::pure]]
std::optional<std::chrono::milliseconds>
ParseUpnpTime(std::string_view s) noexcept;
