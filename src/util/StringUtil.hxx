// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <string>
#include <string_view>

constexpr bool
IsWhitespaceASCII(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' ||
		ch == '\f' || ch == '\v';
}

constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z' ? char(ch - 'A' + 'a') : ch;
}

[[gnu::pure]]
std::string_view
StripLeft(std::string_view s) noexcept;

[[gnu::pure]]
std::string_view
StripRight(std::string_view s) noexcept;

/**
 * Remove whitespace at both ends.
 */
[[gnu::pure]]
std::string_view
Strip(std::string_view s) noexcept;

std::string
ToLowerASCII(std::string_view s) noexcept;

[[gnu::pure]]
bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept;

/**
 * Case-insensitive substring search (ASCII only).
 */
[[gnu::pure]]
bool
StringContainsIgnoreCase(std::string_view haystack,
			 std::string_view needle) noexcept;

/**
 * Strip an XML namespace prefix, e.g. "u:PlayResponse" becomes
 * "PlayResponse".
 */
[[gnu::pure]]
std::string_view
StripXmlPrefix(std::string_view name) noexcept;
