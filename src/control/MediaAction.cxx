// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "MediaAction.hxx"
#include "util/StringUtil.hxx"

#include <array>

using std::string_view_literals::operator""sv;

struct MediaActionName {
	MediaAction action;
	std::string_view upnp_name;
	std::string_view enum_name;
};

static constexpr std::array media_action_names{
	MediaActionName{MediaAction::PLAY, "Play"sv, "PLAY"sv},
	MediaActionName{MediaAction::PAUSE, "Pause"sv, "PAUSE"sv},
	MediaActionName{MediaAction::STOP, "Stop"sv, "STOP"sv},
	MediaActionName{MediaAction::SEEK, "Seek"sv, "SEEK"sv},
	MediaActionName{MediaAction::SET_AV_TRANSPORT_URI, "SetAVTransportURI"sv, "SET_AV_TRANSPORT_URI"sv},
	MediaActionName{MediaAction::GET_POSITION_INFO, "GetPositionInfo"sv, "GET_POSITION_INFO"sv},
	MediaActionName{MediaAction::GET_TRANSPORT_INFO, "GetTransportInfo"sv, "GET_TRANSPORT_INFO"sv},
	MediaActionName{MediaAction::GET_VOLUME, "GetVolume"sv, "GET_VOLUME"sv},
	MediaActionName{MediaAction::SET_VOLUME, "SetVolume"sv, "SET_VOLUME"sv},
	MediaActionName{MediaAction::GET_MUTE, "GetMute"sv, "GET_MUTE"sv},
	MediaActionName{MediaAction::SET_MUTE, "SetMute"sv, "SET_MUTE"sv},
};

std::string_view
GetActionName(MediaAction action) noexcept
{
	for (const auto &i : media_action_names)
		if (i.action == action)
			return i.upnp_name;

	return {};
}

std::optional<MediaAction>
ParseMediaAction(std::string_view name) noexcept
{
	for (const auto &i : media_action_names)
		if (StringIsEqualIgnoreCase(name, i.upnp_name) ||
		    StringIsEqualIgnoreCase(name, i.enum_name))
			return i.action;

	return std::nullopt;
}
