// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <fmt/core.h>

#include <utility>

#include <pthread.h>

static inline void
SetThreadName(const char *name) noexcept
{
	pthread_setname_np(pthread_self(), name);
}

/**
 * Set the name of the current thread from a format string.  Linux
 * truncates thread names to 15 characters.
 */
template<typename... Args>
static inline void
FmtThreadName(fmt::format_string<Args...> fmt, Args&&... args) noexcept
{
	char buffer[16];
	const auto result = fmt::format_to_n(buffer, sizeof(buffer) - 1,
					     fmt, std::forward<Args>(args)...);
	*result.out = 0;
	SetThreadName(buffer);
}
