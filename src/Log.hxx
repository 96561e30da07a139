// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "LogLevel.hxx"

#include <fmt/core.h>

#include <exception>
#include <string_view>
#include <utility>

class Domain;
struct CastError;

/**
 * Emit a message if #level is not below the threshold.  May be
 * called from any thread.
 */
void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept;

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
void
LogFmt(LogLevel level, const Domain &domain,
       const S &format_str, Args&&... args) noexcept
{
	return LogVFmt(level, domain, format_str,
		       fmt::make_format_args(args...));
}

template<typename S, typename... Args>
void
FmtDebug(const Domain &domain,
	 const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::DEBUG, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtInfo(const Domain &domain,
	const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::INFO, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtNotice(const Domain &domain,
	  const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::NOTICE, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtWarning(const Domain &domain,
	   const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::WARNING, domain, format_str, args...);
}

static inline void
LogDebug(const Domain &domain, const char *msg) noexcept
{
	Log(LogLevel::DEBUG, domain, msg);
}

static inline void
LogWarning(const Domain &domain, const char *msg) noexcept
{
	Log(LogLevel::WARNING, domain, msg);
}

/**
 * Log an exception with all nested exceptions, prefixed with
 * #msg.
 */
void
Log(LogLevel level, const std::exception_ptr &ep, const char *msg) noexcept;

inline void
LogError(const std::exception_ptr &ep, const char *msg) noexcept
{
	Log(LogLevel::ERROR, ep, msg);
}

/**
 * Log a #CastError with its category and code, e.g. "Play failed:
 * connection refused [CONNECTION 2001]".
 *
 * @param what a description of the failed operation; may be empty
 */
void
LogCastError(LogLevel level, const Domain &domain, std::string_view what,
	     const CastError &error) noexcept;
