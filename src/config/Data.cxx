// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Data.hxx"
#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <fmt/chrono.h>

const char *
ConfigData::GetString(ConfigOption option,
		      const char *default_value) const noexcept
{
	const auto *param = GetParam(option);
	if (param == nullptr)
		return default_value;

	return param->value.c_str();
}

unsigned
ConfigData::GetUnsigned(ConfigOption option,
			unsigned min_value, unsigned max_value,
			unsigned default_value) const
{
	return With(option, [=](const char *s){
		if (s == nullptr)
			return default_value;

		const unsigned value = ParseUnsigned(s);
		if (value < min_value || value > max_value)
			throw FmtRuntimeError("Value must be between {} and {}",
					      min_value, max_value);

		return value;
	});
}

std::chrono::steady_clock::duration
ConfigData::GetDuration(ConfigOption option,
			std::chrono::steady_clock::duration min_value,
			std::chrono::steady_clock::duration max_value,
			std::chrono::steady_clock::duration default_value) const
{
	return With(option, [=](const char *s){
		if (s == nullptr)
			return default_value;

		const auto value = ParseDuration(s);
		if (value < min_value || value > max_value) {
			using std::chrono::duration_cast;
			using std::chrono::milliseconds;

			throw FmtRuntimeError("Value must be between {} and {}",
					      duration_cast<milliseconds>(min_value),
					      duration_cast<milliseconds>(max_value));
		}

		return value;
	});
}

bool
ConfigData::GetBool(ConfigOption option, bool default_value) const
{
	return With(option, [default_value](const char *s){
		return s != nullptr
			? ParseBool(s)
			: default_value;
	});
}
