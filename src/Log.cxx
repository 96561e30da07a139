// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Log.hxx"
#include "error/CastError.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"

#include <fmt/format.h>

#include <iterator> // for std::back_inserter()

static constexpr Domain exception_domain("exception");

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	Log(level, domain, {buffer.data(), buffer.size()});
}

void
Log(LogLevel level, const std::exception_ptr &ep, const char *msg) noexcept
{
	LogFmt(level, exception_domain, "{}: {}", msg, ep);
}

void
LogCastError(LogLevel level, const Domain &domain, std::string_view what,
	     const CastError &error) noexcept
{
	if (what.empty())
		LogFmt(level, domain, "{} [{} {}]",
		       error.message, ToString(error.category), error.GetCode());
	else
		LogFmt(level, domain, "{}: {} [{} {}]", what,
		       error.message, ToString(error.category), error.GetCode());
}

LogLevel
ParseLogLevel(std::string_view value)
{
	using std::string_view_literals::operator""sv;

	if (value == "notice"sv)
		return LogLevel::NOTICE;
	else if (value == "info"sv)
		return LogLevel::INFO;
	else if (value == "verbose"sv)
		return LogLevel::DEBUG;
	else if (value == "warning"sv)
		return LogLevel::WARNING;
	else if (value == "error"sv)
		return LogLevel::ERROR;
	else
		throw FmtInvalidArgument("unknown log level \"{}\"", value);
}
