// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "OptionParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <string_view>

const char *
OptionParser::CheckShiftValue(const char *s, const OptionDef &option)
{
	if (!option.HasValue())
		return nullptr;

	if (args.empty())
		throw FmtRuntimeError("Value expected after {}", s);

	return Shift();
}

OptionParser::Result
OptionParser::IdentifyOption(const char *s)
{
	if (s[1] == '-') {
		const std::string_view name{s + 2};

		for (const auto &i : options) {
			if (!i.HasLongOption())
				continue;

			const std::string_view long_option{i.GetLongOption()};
			if (!name.starts_with(long_option))
				continue;

			const auto rest = name.substr(long_option.size());

			const char *value;
			if (rest.empty())
				value = CheckShiftValue(s, i);
			else if (rest.front() == '=' && i.HasValue())
				value = rest.data() + 1;
			else
				continue;

			return {int(&i - options.data()), value};
		}
	} else if (s[1] != 0 && s[2] == 0) {
		const char ch = s[1];

		for (const auto &i : options) {
			if (i.HasShortOption() && ch == i.GetShortOption()) {
				const char *value = CheckShiftValue(s, i);
				return {int(&i - options.data()), value};
			}
		}
	}

	throw FmtRuntimeError("Unknown option: {}", s);
}

OptionParser::Result
OptionParser::Next()
{
	while (!args.empty()) {
		const char *arg = Shift();

		if (arg[0] == '-' && arg[1] == '-' && arg[2] == 0) {
			/* "--": the rest are not options */
			for (const char *i : args)
				remaining.push_back(i);
			args = {};
			break;
		}

		if (arg[0] == '-' && arg[1] != 0)
			return IdentifyOption(arg);

		remaining.push_back(arg);
	}

	return {-1, nullptr};
}
