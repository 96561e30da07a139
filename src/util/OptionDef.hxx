// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

/**
 * Command line option definition.
 */
class OptionDef
{
	const char *long_option;
	char short_option;
	bool has_value = false;
	const char *desc;

public:
	constexpr OptionDef(const char *_long_option,
			    char _short_option, const char *_desc) noexcept
		:long_option(_long_option),
		 short_option(_short_option),
		 desc(_desc) {}

	constexpr OptionDef(const char *_long_option,
			    char _short_option, bool _has_value,
			    const char *_desc) noexcept
		:long_option(_long_option),
		 short_option(_short_option),
		 has_value(_has_value),
		 desc(_desc) {}

	constexpr bool HasLongOption() const noexcept {
		return long_option != nullptr;
	}

	constexpr bool HasShortOption() const noexcept {
		return short_option != 0;
	}

	constexpr bool HasValue() const noexcept {
		return has_value;
	}

	constexpr bool HasDescription() const noexcept {
		return desc != nullptr;
	}

	constexpr const char *GetLongOption() const noexcept {
		return long_option;
	}

	constexpr char GetShortOption() const noexcept {
		return short_option;
	}

	constexpr const char *GetDescription() const noexcept {
		return desc;
	}
};
