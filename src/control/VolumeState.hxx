// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <chrono>
#include <mutex>
#include <optional>

/**
 * Caches the volume and mute state last read from or written to the
 * RenderingControl service.
 */
class VolumeState {
public:
	using Clock = std::chrono::steady_clock;

	/**
	 * Cached values older than this are considered stale by
	 * default.
	 */
	static constexpr std::chrono::seconds DEFAULT_MAX_AGE{10};

	struct Snapshot {
		std::optional<unsigned> volume;
		std::optional<bool> muted;
	};

private:
	mutable std::mutex mutex;

	std::optional<unsigned> volume;
	Clock::time_point volume_time;

	std::optional<bool> muted;
	Clock::time_point muted_time;

public:
	void SetVolume(unsigned _volume, Clock::time_point now=Clock::now()) noexcept {
		const std::scoped_lock protect{mutex};
		volume = _volume;
		volume_time = now;
	}

	void SetMuted(bool _muted, Clock::time_point now=Clock::now()) noexcept {
		const std::scoped_lock protect{mutex};
		muted = _muted;
		muted_time = now;
	}

	/**
	 * @return the cached volume if it is younger than #max_age
	 */
	std::optional<unsigned> GetFreshVolume(Clock::duration max_age=DEFAULT_MAX_AGE,
					       Clock::time_point now=Clock::now()) const noexcept {
		const std::scoped_lock protect{mutex};
		if (volume && now - volume_time <= max_age)
			return volume;
		return std::nullopt;
	}

	std::optional<bool> GetFreshMuted(Clock::duration max_age=DEFAULT_MAX_AGE,
					  Clock::time_point now=Clock::now()) const noexcept {
		const std::scoped_lock protect{mutex};
		if (muted && now - muted_time <= max_age)
			return muted;
		return std::nullopt;
	}

	/**
	 * The last known values, regardless of their age.
	 */
	Snapshot Get() const noexcept {
		const std::scoped_lock protect{mutex};
		return {volume, muted};
	}

	void Clear() noexcept {
		const std::scoped_lock protect{mutex};
		volume.reset();
		muted.reset();
	}
};
