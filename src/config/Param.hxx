// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "Option.hxx"

#include <concepts>
#include <string>
#include <utility>

/**
 * The raw value of one setting.
 */
struct ConfigParam {
	std::string value;

	/**
	 * The line number in the configuration file; 0 if the value
	 * was not loaded from a file.
	 */
	unsigned line = 0;

	ConfigParam() = default;

	ConfigParam(std::string _value, unsigned _line) noexcept
		:value(std::move(_value)), line(_line) {}

	/**
	 * Call this method in a "catch" block to throw a nested
	 * exception naming the setting and its location in the
	 * configuration file.
	 */
	[[noreturn]]
	void ThrowWithNested(ConfigOption option) const;

	/**
	 * Invoke a function with the configured value; if the
	 * function throws, call ThrowWithNested().
	 */
	template<std::regular_invocable<const char *> F>
	auto With(ConfigOption option, F &&f) const {
		try {
			return f(value.c_str());
		} catch (...) {
			ThrowWithNested(option);
		}
	}
};
