// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "File.hxx"
#include "Data.hxx"
#include "Param.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/StringUtil.hxx"
#include "Log.hxx"

#include <cerrno>
#include <fstream>
#include <string>
#include <system_error>

static constexpr char CONF_COMMENT = '#';

static constexpr Domain config_file_domain("config_file");

static constexpr bool
IsWordChar(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') || ch == '_';
}

/**
 * Consume the option name at the beginning of the line.
 */
static std::string
NextWord(std::string_view &line)
{
	std::size_t n = 0;
	while (n < line.size() && IsWordChar(line[n]))
		++n;

	if (n == 0)
		throw std::runtime_error("Letter expected");

	std::string word{line.substr(0, n)};
	line = StripLeft(line.substr(n));
	return word;
}

/**
 * Consume a double-quoted string; a backslash escapes the next
 * character.
 */
static std::string
NextString(std::string_view &line)
{
	if (line.empty() || line.front() != '"')
		throw std::runtime_error("Value missing");

	std::string value;
	std::size_t i = 1;
	while (true) {
		if (i >= line.size())
			throw std::runtime_error("Missing closing '\"'");

		char ch = line[i++];
		if (ch == '"')
			break;

		if (ch == '\\') {
			if (i >= line.size())
				throw std::runtime_error("Missing closing '\"'");
			ch = line[i++];
		}

		value.push_back(ch);
	}

	line = StripLeft(line.substr(i));
	return value;
}

static std::string
ExpectValueAndEnd(std::string_view &line)
{
	auto value = NextString(line);

	if (!line.empty() && line.front() != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after value");

	return value;
}

void
ReadConfigFile(ConfigData &config_data, std::istream &is)
{
	std::string buffer;
	unsigned line_number = 0;

	try {
		while (std::getline(is, buffer)) {
			++line_number;

			std::string_view line = StripLeft(buffer);
			if (line.empty() || line.front() == CONF_COMMENT)
				continue;

			const std::string name = NextWord(line);
			const ConfigOption o = ParseConfigOptionName(name);
			if (o == ConfigOption::MAX)
				throw FmtRuntimeError("unrecognized parameter: {}",
						      name);

			config_data.SetParam(o, ConfigParam(ExpectValueAndEnd(line),
							    line_number));
		}
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error on line {}",
						       line_number));
	}
}

void
ReadConfigFile(ConfigData &config_data, const char *path)
{
	FmtDebug(config_file_domain, "loading file {}", path);

	std::ifstream file{path};
	if (!file)
		throw std::system_error(errno, std::generic_category(),
					fmt::format("Failed to open {}", path));

	try {
		ReadConfigFile(config_data, file);
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in {}", path));
	}
}
