// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <string>
#include <string_view>

/**
 * Concatenate two URL parts with exactly one slash between them.
 */
std::string
ConcatUrl(std::string_view s1, std::string_view s2) noexcept;

/**
 * Return the "directory" part of an URL (everything up to and
 * including the last slash of the path).
 */
std::string
GetParentUrl(std::string_view url) noexcept;

/**
 * Resolve a (possibly relative) URL from a device description
 * against the device's URL base.
 */
std::string
ResolveUrl(std::string_view base, std::string_view url) noexcept;

/**
 * Return the "host[:port]" part of an absolute URL, or an empty
 * string if it is not an absolute URL.
 */
[[gnu::pure]]
std::string_view
GetUrlHost(std::string_view url) noexcept;

/**
 * Return the file name extension of an URL path, without query
 * string or fragment.  The result is lower case and may be empty.
 */
std::string
GetUrlExtension(std::string_view url) noexcept;

/**
 * Convert a UDN to the form used as registry key: without
 * surrounding whitespace and in lower case.
 */
std::string
NormalizeUdn(std::string_view udn) noexcept;
