// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "Option.hxx"
#include "Param.hxx"

#include <array>
#include <chrono>
#include <optional>

/**
 * The settings loaded from the configuration file, not yet
 * interpreted.  Each option has at most one value; a later
 * occurrence replaces the earlier one.
 */
struct ConfigData {
	std::array<std::optional<ConfigParam>, std::size_t(ConfigOption::MAX)> params;

	void Clear() noexcept {
		for (auto &i : params)
			i.reset();
	}

	void SetParam(ConfigOption option, ConfigParam &&param) noexcept {
		params[std::size_t(option)] = std::move(param);
	}

	[[gnu::pure]]
	const ConfigParam *GetParam(ConfigOption option) const noexcept {
		const auto &param = params[std::size_t(option)];
		return param ? &*param : nullptr;
	}

	/**
	 * Invoke a function with the value of the option, or with
	 * nullptr if it is not set.  Exceptions are wrapped with the
	 * option name and the line number.
	 */
	template<typename F>
	auto With(ConfigOption option, F &&f) const {
		const auto *param = GetParam(option);
		return param != nullptr
			? param->With(option, std::forward<F>(f))
			: f(nullptr);
	}

	[[gnu::pure]]
	const char *GetString(ConfigOption option,
			      const char *default_value=nullptr) const noexcept;

	/**
	 * Throws if the value is not a number between #min_value and
	 * #max_value.
	 */
	unsigned GetUnsigned(ConfigOption option,
			     unsigned min_value, unsigned max_value,
			     unsigned default_value) const;

	/**
	 * Throws if the value is not a duration between #min_value and
	 * #max_value.
	 */
	std::chrono::steady_clock::duration
	GetDuration(ConfigOption option,
		    std::chrono::steady_clock::duration min_value,
		    std::chrono::steady_clock::duration max_value,
		    std::chrono::steady_clock::duration default_value) const;

	bool GetBool(ConfigOption option, bool default_value) const;
};
