// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

enum class MediaAction : uint8_t {
	PLAY,
	PAUSE,
	STOP,
	SEEK,
	SET_AV_TRANSPORT_URI,
	GET_POSITION_INFO,
	GET_TRANSPORT_INFO,
	GET_VOLUME,
	SET_VOLUME,
	GET_MUTE,
	SET_MUTE,
};

/**
 * Named input values of an action, e.g. "CurrentURI".
 */
using ActionInputs = std::map<std::string, std::string, std::less<>>;

/**
 * Named output values of an action.  On failure, this contains the
 * keys "Error", "ErrorCategory" and "ErrorCode".
 */
using ActionResult = std::map<std::string, std::string, std::less<>>;

/**
 * The UPnP action name, e.g. "SetAVTransportURI".
 */
[[gnu::const]]
std::string_view
GetActionName(MediaAction action) noexcept;

/**
 * Does this action belong to the RenderingControl service?
 */
constexpr bool
IsRenderingControlAction(MediaAction action) noexcept
{
	return action == MediaAction::GET_VOLUME ||
		action == MediaAction::SET_VOLUME ||
		action == MediaAction::GET_MUTE ||
		action == MediaAction::SET_MUTE;
}

/**
 * Parse an action name (case-insensitive).  Both the UPnP name
 * ("SetAVTransportURI") and the enum name ("SET_AV_TRANSPORT_URI")
 * are accepted.
 */
[[gnu::pure]]
std::optional<MediaAction>
ParseMediaAction(std::string_view name) noexcept;
