// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Option.hxx"

#include <array>

using std::string_view_literals::operator""sv;

static constexpr std::array config_option_names{
	"log_level"sv,
	"log_timestamp"sv,
	"network_interface"sv,
	"search_timeout"sv,
	"search_mx"sv,
	"tombstone_grace"sv,
	"max_devices"sv,
	"connect_timeout"sv,
	"soap_timeout"sv,
	"description_retries"sv,
	"retry_delay"sv,
	"worker_threads"sv,
	"shutdown_timeout"sv,
	"user_agent"sv,
};

static_assert(config_option_names.size() == std::size_t(ConfigOption::MAX),
	      "Wrong number of config_option_names");

std::string_view
GetConfigOptionName(ConfigOption option) noexcept
{
	return config_option_names[std::size_t(option)];
}

ConfigOption
ParseConfigOptionName(std::string_view name) noexcept
{
	std::size_t i = 0;
	for (; i < config_option_names.size(); ++i)
		if (config_option_names[i] == name)
			break;

	return ConfigOption(i);
}
