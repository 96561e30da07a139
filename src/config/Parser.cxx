// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringUtil.hxx"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string_view>

using std::string_view_literals::operator""sv;

bool
ParseBool(const char *value)
{
	const std::string_view s{value};

	for (const auto t : {"yes"sv, "true"sv, "1"sv})
		if (StringIsEqualIgnoreCase(s, t))
			return true;

	for (const auto f : {"no"sv, "false"sv, "0"sv})
		if (StringIsEqualIgnoreCase(s, f))
			return false;

	throw FmtRuntimeError(R"(Not a valid boolean ("yes" or "no"): "{}")", value);
}

static long
ParseLong(const char *s, const char **endptr_r)
{
	char *endptr;
	errno = 0;
	long value = strtol(s, &endptr, 10);
	if (endptr == s)
		throw std::runtime_error("Failed to parse number");

	if (errno == ERANGE)
		throw std::runtime_error("Number is out of range");

	*endptr_r = endptr;
	return value;
}

long
ParseLong(const char *s)
{
	const char *endptr;
	long value = ParseLong(s, &endptr);
	if (*endptr != 0)
		throw std::runtime_error("Failed to parse number");

	return value;
}

unsigned
ParseUnsigned(const char *s)
{
	auto value = ParseLong(s);
	if (value < 0)
		throw std::runtime_error("Value must not be negative");

	if ((unsigned long)value > std::numeric_limits<unsigned>::max())
		throw std::runtime_error("Value is too large");

	return (unsigned)value;
}

unsigned
ParsePositive(const char *s)
{
	auto value = ParseLong(s);
	if (value <= 0)
		throw std::runtime_error("Value must be positive");

	if ((unsigned long)value > std::numeric_limits<unsigned>::max())
		throw std::runtime_error("Value is too large");

	return (unsigned)value;
}

std::chrono::steady_clock::duration
ParseDuration(const char *s)
{
	const char *endptr;
	const long value = ParseLong(s, &endptr);
	if (value < 0)
		throw std::runtime_error("Value must not be negative");

	const std::string_view suffix{endptr};
	if (suffix.empty() || suffix == "s"sv)
		return std::chrono::seconds{value};
	else if (suffix == "ms"sv)
		return std::chrono::milliseconds{value};
	else
		throw std::runtime_error("Unknown duration suffix");
}
