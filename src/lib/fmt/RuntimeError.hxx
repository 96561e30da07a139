// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <utility>

/**
 * Construct a #std::runtime_error with a message built by
 * fmt::format().
 */
template<typename S, typename... Args>
std::runtime_error
FmtRuntimeError(const S &format_str, Args&&... args) noexcept
{
	return std::runtime_error{fmt::vformat(format_str, fmt::make_format_args(args...))};
}

template<typename S, typename... Args>
std::invalid_argument
FmtInvalidArgument(const S &format_str, Args&&... args) noexcept
{
	return std::invalid_argument{fmt::vformat(format_str, fmt::make_format_args(args...))};
}
