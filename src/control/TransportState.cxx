// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "TransportState.hxx"

#include <algorithm>
#include <initializer_list>

using std::string_view_literals::operator""sv;

std::string_view
ToString(TransportState state) noexcept
{
	switch (state) {
	case TransportState::IDLE:
		return "IDLE"sv;
	case TransportState::CONNECTING:
		return "CONNECTING"sv;
	case TransportState::CONNECTED:
		return "CONNECTED"sv;
	case TransportState::BUFFERING:
		return "BUFFERING"sv;
	case TransportState::PLAYING:
		return "PLAYING"sv;
	case TransportState::PAUSED:
		return "PAUSED"sv;
	case TransportState::STOPPED:
		return "STOPPED"sv;
	case TransportState::TRANSITIONING:
		return "TRANSITIONING"sv;
	case TransportState::COMPLETED:
		return "COMPLETED"sv;
	case TransportState::ERROR:
		return "ERROR"sv;
	}

	return "IDLE"sv;
}

TransportState
ParseUpnpTransportState(std::string_view s) noexcept
{
	if (s == "PLAYING"sv)
		return TransportState::PLAYING;
	else if (s == "PAUSED_PLAYBACK"sv || s == "PAUSED_RECORDING"sv)
		return TransportState::PAUSED;
	else if (s == "STOPPED"sv)
		return TransportState::STOPPED;
	else if (s == "TRANSITIONING"sv)
		return TransportState::TRANSITIONING;
	else
		/* including "NO_MEDIA_PRESENT" */
		return TransportState::IDLE;
}

std::string_view
ToUpnpTransportState(TransportState state) noexcept
{
	switch (state) {
	case TransportState::PLAYING:
	case TransportState::BUFFERING:
		return "PLAYING"sv;

	case TransportState::PAUSED:
		return "PAUSED_PLAYBACK"sv;

	case TransportState::TRANSITIONING:
	case TransportState::CONNECTING:
		return "TRANSITIONING"sv;

	case TransportState::IDLE:
		return "NO_MEDIA_PRESENT"sv;

	case TransportState::CONNECTED:
	case TransportState::STOPPED:
	case TransportState::COMPLETED:
	case TransportState::ERROR:
		break;
	}

	return "STOPPED"sv;
}

static constexpr bool
Contains(std::initializer_list<TransportState> l, TransportState s) noexcept
{
	return std::find(l.begin(), l.end(), s) != l.end();
}

bool
IsValidTransition(TransportState from, TransportState to) noexcept
{
	using S = TransportState;

	if (from == to)
		return true;

	switch (from) {
	case S::IDLE:
	case S::ERROR:
		/* a fresh start is always possible */
		return true;

	case S::CONNECTING:
		return Contains({S::CONNECTED, S::ERROR}, to);

	case S::CONNECTED:
		return Contains({S::PLAYING, S::STOPPED, S::ERROR,
				 S::BUFFERING, S::TRANSITIONING}, to);

	case S::PLAYING:
		return Contains({S::PAUSED, S::STOPPED, S::TRANSITIONING, S::ERROR,
				 S::BUFFERING, S::COMPLETED}, to);

	case S::PAUSED:
		return Contains({S::PLAYING, S::STOPPED, S::ERROR}, to);

	case S::STOPPED:
		return Contains({S::PLAYING, S::ERROR, S::TRANSITIONING}, to);

	case S::TRANSITIONING:
	case S::BUFFERING:
		return Contains({S::PLAYING, S::PAUSED, S::STOPPED, S::ERROR}, to);

	case S::COMPLETED:
		return Contains({S::PLAYING, S::STOPPED, S::IDLE, S::ERROR}, to);
	}

	return false;
}
