// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <cstdint>
#include <string_view>

enum class TransportState : uint8_t {
	/**
	 * Nothing loaded, or the state is unknown.
	 */
	IDLE,

	CONNECTING,
	CONNECTED,
	BUFFERING,
	PLAYING,
	PAUSED,
	STOPPED,
	TRANSITIONING,
	COMPLETED,
	ERROR,
};

[[gnu::const]]
std::string_view
ToString(TransportState state) noexcept;

/**
 * Map a "CurrentTransportState" value reported by a renderer.
 * Unknown values map to #TransportState::IDLE.
 */
[[gnu::pure]]
TransportState
ParseUpnpTransportState(std::string_view s) noexcept;

/**
 * The state a renderer reports for our state, used when no
 * authoritative value is known.
 */
[[gnu::const]]
std::string_view
ToUpnpTransportState(TransportState state) noexcept;

/**
 * Is the transition from #from to #to allowed?  Staying in the same
 * state is always allowed.
 */
[[gnu::const]]
bool
IsValidTransition(TransportState from, TransportState to) noexcept;
