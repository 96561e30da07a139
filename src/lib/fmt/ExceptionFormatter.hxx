// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "util/Exception.hxx"

#include <fmt/format.h>

/**
 * Allows passing a #std::exception_ptr to fmt::format(); it formats
 * the full message chain of the exception.
 */
template<>
struct fmt::formatter<std::exception_ptr> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(std::exception_ptr ep, FormatContext &ctx) const {
		return formatter<string_view>::format(GetFullMessage(ep), ctx);
	}
};
