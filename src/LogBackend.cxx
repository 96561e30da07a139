// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "util/Domain.hxx"
#include "util/StringUtil.hxx"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <mutex>

#include <stdio.h>
#include <time.h>

static std::atomic<LogLevel> log_threshold{LogLevel::NOTICE};

static std::atomic_bool enable_timestamp{false};

/* log messages arrive from libupnp callback threads and from the
   worker pool at the same time */
static std::mutex log_mutex;

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold = _threshold;
}

LogLevel
GetLogThreshold() noexcept
{
	return log_threshold;
}

void
EnableLogTimestamp() noexcept
{
	enable_timestamp = true;
}

static std::string
log_date() noexcept
{
	const time_t t = time(nullptr);
	struct tm tm;
	if (localtime_r(&t, &tm) == nullptr)
		return {};

	return fmt::format("{:%FT%T} ", tm);
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < log_threshold)
		return;

	const std::string date = enable_timestamp ? log_date() : std::string{};

	const std::scoped_lock protect{log_mutex};
	fmt::print(stderr, "{}{}: {}\n",
		   date, domain.GetName(), StripRight(msg));
}
