// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "SoapEnvelope.hxx"

#include <mutex>
#include <string>

/**
 * The result of "GetPositionInfo".  Times are in the "H+:MM:SS"
 * format.
 */
struct PositionInfo {
	unsigned track = 1;
	std::string track_duration = "00:00:00";
	std::string track_metadata;
	std::string track_uri;
	std::string rel_time = "00:00:00";
	std::string abs_time = "NOT_IMPLEMENTED";
	int rel_count = 0;
	int abs_count = 0;
};

class PositionListener {
public:
	virtual void OnPositionChanged(const std::string &position,
				       const std::string &duration) noexcept = 0;
};

/**
 * Tracks the playback position and the current media of one
 * renderer.
 */
class PositionInfoManager {
	mutable std::mutex mutex;

	PositionInfo info;

	PositionListener *listener = nullptr;

public:
	/**
	 * Must be called before any other method.
	 */
	void SetListener(PositionListener *_listener) noexcept {
		listener = _listener;
	}

	/**
	 * Reset the position and duration (after loading new media).
	 * The media URI and metadata are kept.
	 */
	void Reset() noexcept;

	void UpdatePosition(std::string position) noexcept;

	void UpdateDuration(std::string duration) noexcept;

	/**
	 * Remember the media passed to "SetAVTransportURI".  This
	 * resets the position.
	 */
	void UpdateMediaInfo(std::string metadata, std::string uri) noexcept;

	/**
	 * Apply the output of a "GetPositionInfo" action.  Missing
	 * values keep their previous value, and placeholders such as
	 * "NOT_IMPLEMENTED" or "00:00:00" never replace a known duration
	 * or position.
	 *
	 * @return the new #PositionInfo, with the position and
	 * duration exactly as reported by the renderer
	 */
	PositionInfo Reconcile(const SoapValues &values) noexcept;

	PositionInfo GetPositionInfo() const noexcept {
		const std::scoped_lock protect{mutex};
		return info;
	}

	static PositionInfo GetDefaultPositionInfo() noexcept {
		return {};
	}

private:
	void Notify(const PositionInfo &i) noexcept {
		if (listener != nullptr)
			listener->OnPositionChanged(i.rel_time, i.track_duration);
	}
};
