// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "TimeUtil.hxx"
#include "util/StringUtil.hxx"

#include <fmt/format.h>

#include <charconv>

std::string
FormatUpnpTime(std::chrono::milliseconds t) noexcept
{
	if (t.count() < 0)
		t = {};

	const auto total = std::chrono::duration_cast<std::chrono::seconds>(t).count();
	return fmt::format("{:02}:{:02}:{:02}",
			   total / 3600, (total / 60) % 60, total % 60);
}

/**
 * Parse a non-empty string of decimal digits.
 */
static std::optional<unsigned long>
ParseDigits(std::string_view s) noexcept
{
	if (s.empty())
		return std::nullopt;

	unsigned long value;
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (ec != std::errc{} || ptr != s.data() + s.size())
		return std::nullopt;

	return value;
}

/**
 * Parse the fraction after the decimal point and return it in
 * milliseconds.
 */
static std::optional<unsigned long>
ParseFraction(std::string_view s) noexcept
{
	if (!ParseDigits(s))
		return std::nullopt;

	unsigned long ms = 0, factor = 100;
	for (std::size_t i = 0; i < s.size() && factor > 0; ++i, factor /= 10)
		ms += (s[i] - '0') * factor;

	return ms;
}

std::optional<std::chrono::milliseconds>
ParseUpnpTime(std::string_view s) noexcept
{
	s = Strip(s);

	unsigned long fraction_ms = 0;
	if (auto dot = s.find('.'); dot != s.npos) {
		auto fraction = ParseFraction(s.substr(dot + 1));
		if (!fraction)
			return std::nullopt;

		fraction_ms = *fraction;
		s = s.substr(0, dot);
	}

	const auto colon2 = s.rfind(':');
	if (colon2 == s.npos)
		return std::nullopt;

	const auto seconds = ParseDigits(s.substr(colon2 + 1));
	if (!seconds || *seconds >= 60 || colon2 + 3 != s.size())
		return std::nullopt;

	s = s.substr(0, colon2);

	unsigned long hours = 0, minutes;
	if (const auto colon1 = s.rfind(':'); colon1 != s.npos) {
		const auto h = ParseDigits(s.substr(0, colon1));
		const auto m = ParseDigits(s.substr(colon1 + 1));
		if (!h || !m || *m >= 60 || colon1 + 3 != s.size())
			return std::nullopt;

		hours = *h;
		minutes = *m;
	} else {
		/* "MM:SS" */
		const auto m = ParseDigits(s);
		if (!m)
			return std::nullopt;

		minutes = *m;
	}

	return std::chrono::milliseconds((hours * 3600 + minutes * 60 + *seconds) * 1000
					 + fraction_ms);
}
