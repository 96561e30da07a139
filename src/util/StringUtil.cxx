// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "StringUtil.hxx"

#include <algorithm>

std::string_view
StripLeft(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceASCII(s.front()))
		s.remove_prefix(1);
	return s;
}

std::string_view
StripRight(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceASCII(s.back()))
		s.remove_suffix(1);
	return s;
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}

std::string
ToLowerASCII(std::string_view s) noexcept
{
	std::string result;
	result.reserve(s.size());
	for (const char ch : s)
		result.push_back(ToLowerASCII(ch));
	return result;
}

static constexpr bool
CharEqualIgnoreCase(char a, char b) noexcept
{
	return ToLowerASCII(a) == ToLowerASCII(b);
}

bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	return std::equal(a.begin(), a.end(), b.begin(), b.end(),
			  CharEqualIgnoreCase);
}

bool
StringContainsIgnoreCase(std::string_view haystack,
			 std::string_view needle) noexcept
{
	return std::search(haystack.begin(), haystack.end(),
			   needle.begin(), needle.end(),
			   CharEqualIgnoreCase) != haystack.end();
}

std::string_view
StripXmlPrefix(std::string_view name) noexcept
{
	const auto colon = name.find(':');
	if (colon != name.npos)
		name.remove_prefix(colon + 1);
	return name;
}
