// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "PositionInfoManager.hxx"

#include <charconv>

using std::string_view_literals::operator""sv;

/**
 * Does this string carry an actual time value?
 */
[[gnu::pure]]
static bool
IsKnownTime(std::string_view s) noexcept
{
	return !s.empty() && s != "NOT_IMPLEMENTED"sv &&
		s != "00:00:00"sv && s != "0:00:00"sv;
}

static const std::string *
FindValue(const SoapValues &values, std::string_view name) noexcept
{
	auto i = values.find(name);
	return i != values.end() ? &i->second : nullptr;
}

template<typename T>
static void
ParseNumber(T &dest, const std::string *s) noexcept
{
	if (s == nullptr)
		return;

	T value;
	auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), value);
	if (ec == std::errc{} && ptr == s->data() + s->size())
		dest = value;
}

void
PositionInfoManager::Reset() noexcept
{
	PositionInfo copy;

	{
		const std::scoped_lock protect{mutex};
		info.rel_time = info.track_duration = "00:00:00";
		info.abs_time = "NOT_IMPLEMENTED";
		info.rel_count = info.abs_count = 0;
		copy = info;
	}

	Notify(copy);
}

void
PositionInfoManager::UpdatePosition(std::string position) noexcept
{
	PositionInfo copy;

	{
		const std::scoped_lock protect{mutex};
		info.rel_time = std::move(position);
		copy = info;
	}

	Notify(copy);
}

void
PositionInfoManager::UpdateDuration(std::string duration) noexcept
{
	PositionInfo copy;

	{
		const std::scoped_lock protect{mutex};
		info.track_duration = std::move(duration);
		copy = info;
	}

	Notify(copy);
}

void
PositionInfoManager::UpdateMediaInfo(std::string metadata,
				     std::string uri) noexcept
{
	{
		const std::scoped_lock protect{mutex};
		info.track_metadata = std::move(metadata);
		info.track_uri = std::move(uri);
	}

	Reset();
}

PositionInfo
PositionInfoManager::Reconcile(const SoapValues &values) noexcept
{
	PositionInfo copy, result;

	{
		const std::scoped_lock protect{mutex};

		ParseNumber(info.track, FindValue(values, "Track"));

		const auto *duration = FindValue(values, "TrackDuration");
		if (duration != nullptr && IsKnownTime(*duration))
			info.track_duration = *duration;

		if (const auto *s = FindValue(values, "TrackMetaData");
		    s != nullptr && *s != "NOT_IMPLEMENTED"sv)
			info.track_metadata = *s;

		if (const auto *s = FindValue(values, "TrackURI");
		    s != nullptr && !s->empty())
			info.track_uri = *s;

		const auto *rel_time = FindValue(values, "RelTime");
		if (rel_time != nullptr && IsKnownTime(*rel_time))
			info.rel_time = *rel_time;

		if (const auto *s = FindValue(values, "AbsTime");
		    s != nullptr && !s->empty())
			info.abs_time = *s;

		ParseNumber(info.rel_count, FindValue(values, "RelCount"));
		ParseNumber(info.abs_count, FindValue(values, "AbsCount"));

		copy = result = info;

		/* the caller gets what the renderer reported, even if
		   it is a placeholder */
		if (duration != nullptr && !duration->empty())
			result.track_duration = *duration;
		if (rel_time != nullptr && !rel_time->empty())
			result.rel_time = *rel_time;
	}

	Notify(copy);
	return result;
}
