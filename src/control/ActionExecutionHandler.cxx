// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "ActionExecutionHandler.hxx"
#include "SoapTransportExecutor.hxx"
#include "TransportStateManager.hxx"
#include "PositionInfoManager.hxx"
#include "VolumeState.hxx"
#include "TimeUtil.hxx"
#include "config/Parser.hxx"
#include "error/CastError.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

using std::string_view_literals::operator""sv;

static constexpr Domain action_domain("action");

static ActionResult
MakeOkResult() noexcept
{
	return {{"Result", "OK"}};
}

/**
 * Return the input value with the given name, or #default_value if
 * it was not specified.
 */
static std::string
GetInput(const ActionInputs &inputs, std::string_view name,
	 std::string_view default_value={}) noexcept
{
	if (auto i = inputs.find(name); i != inputs.end())
		return i->second;

	return std::string{default_value};
}

/**
 * Throws #CastException (INVALID_PARAMETER) if the input is missing
 * or empty.
 */
static const std::string &
RequireInput(const ActionInputs &inputs, std::string_view name)
{
	auto i = inputs.find(name);
	if (i == inputs.end() || i->second.empty())
		throw CastException(ErrorCategory::INVALID_PARAMETER,
				    fmt::format("Missing parameter \"{}\"", name));

	return i->second;
}

static unsigned
ParseVolume(const std::string &s)
{
	unsigned value;

	try {
		value = ParseUnsigned(s.c_str());
	} catch (...) {
		std::throw_with_nested(CastException(ErrorCategory::INVALID_PARAMETER,
						     fmt::format("Invalid volume \"{}\"", s)));
	}

	if (value > 100)
		throw CastException(ErrorCategory::INVALID_PARAMETER,
				    fmt::format("Volume out of range: {}", value));

	return value;
}

static bool
ParseMute(const std::string &s)
{
	try {
		return ParseBool(s.c_str());
	} catch (...) {
		std::throw_with_nested(CastException(ErrorCategory::INVALID_PARAMETER,
						     fmt::format("Invalid mute value \"{}\"", s)));
	}
}

ActionResult
ActionExecutionHandler::MakeErrorResult(const CastError &error) noexcept
{
	return {
		{"Error", error.message},
		{"ErrorCategory", std::string{ToString(error.category)}},
		{"ErrorCode", fmt::format("{}", error.GetCode())},
	};
}

ActionResult
ActionExecutionHandler::Execute(MediaAction action,
				const ActionInputs &inputs) noexcept
try {
	return Dispatch(action, inputs);
} catch (...) {
	const auto error = MakeCastError(std::current_exception());
	LogCastError(LogLevel::WARNING, action_domain,
		     fmt::format("{} failed", GetActionName(action)), error);
	return MakeErrorResult(error);
}

ActionResult
ActionExecutionHandler::Execute(std::string_view action_name,
				const ActionInputs &inputs) noexcept
{
	const auto action = ParseMediaAction(action_name);
	if (!action) {
		FmtWarning(action_domain, "unknown action \"{}\"", action_name);
		return {{"Error", "unknown action"}};
	}

	return Execute(*action, inputs);
}

ActionResult
ActionExecutionHandler::Dispatch(MediaAction action, const ActionInputs &inputs)
{
	const auto instance_id = GetInput(inputs, "InstanceID",
					  transport_state.GetInstanceId());

	switch (action) {
	case MediaAction::PLAY:
		return Play(instance_id, inputs);

	case MediaAction::PAUSE:
		return Pause(instance_id);

	case MediaAction::STOP:
		return Stop(instance_id);

	case MediaAction::SEEK:
		return Seek(instance_id, inputs);

	case MediaAction::SET_AV_TRANSPORT_URI:
		return SetAVTransportURI(instance_id, inputs);

	case MediaAction::GET_POSITION_INFO:
		return GetPositionInfo(instance_id);

	case MediaAction::GET_TRANSPORT_INFO:
		return GetTransportInfo(instance_id);

	case MediaAction::GET_VOLUME:
		return GetVolume(instance_id);

	case MediaAction::SET_VOLUME:
		return SetVolume(instance_id, inputs);

	case MediaAction::GET_MUTE:
		return GetMute(instance_id);

	case MediaAction::SET_MUTE:
		return SetMute(instance_id, inputs);
	}

	throw CastException(ErrorCategory::INVALID_PARAMETER, "unknown action");
}

void
ActionExecutionHandler::CheckTransition(MediaAction action,
					TransportState to) const
{
	const auto from = transport_state.GetState();
	if (!IsValidTransition(from, to))
		throw CastException(ErrorCategory::PLAYBACK,
				    fmt::format("Cannot {} in state {}",
						GetActionName(action),
						ToString(from)));
}

ActionResult
ActionExecutionHandler::Play(const std::string &instance_id,
			     const ActionInputs &inputs)
{
	CheckTransition(MediaAction::PLAY, TransportState::PLAYING);

	av_transport.Invoke("Play"sv, instance_id.c_str(),
			    {{"Speed", GetInput(inputs, "Speed", "1")}});
	transport_state.ForceState(TransportState::PLAYING);
	return MakeOkResult();
}

ActionResult
ActionExecutionHandler::Pause(const std::string &instance_id)
{
	CheckTransition(MediaAction::PAUSE, TransportState::PAUSED);

	av_transport.Invoke("Pause"sv, instance_id.c_str());
	transport_state.ForceState(TransportState::PAUSED);
	return MakeOkResult();
}

ActionResult
ActionExecutionHandler::Stop(const std::string &instance_id)
{
	CheckTransition(MediaAction::STOP, TransportState::STOPPED);

	av_transport.Invoke("Stop"sv, instance_id.c_str());
	transport_state.ForceState(TransportState::STOPPED);
	position.Reset();
	return MakeOkResult();
}

ActionResult
ActionExecutionHandler::Seek(const std::string &instance_id,
			     const ActionInputs &inputs)
{
	auto target = GetInput(inputs, "Target", "00:00:00");
	if (!ParseUpnpTime(target))
		throw CastException(ErrorCategory::INVALID_PARAMETER,
				    fmt::format("Invalid seek target \"{}\"",
						target));

	av_transport.Invoke("Seek"sv, instance_id.c_str(),
			    {{"Unit", "REL_TIME"}, {"Target", target}});
	position.UpdatePosition(std::move(target));
	return MakeOkResult();
}

ActionResult
ActionExecutionHandler::SetAVTransportURI(const std::string &instance_id,
					  const ActionInputs &inputs)
{
	const auto &uri = RequireInput(inputs, "CurrentURI");
	auto metadata = GetInput(inputs, "CurrentURIMetaData");

	const bool connecting =
		transport_state.GetState() == TransportState::IDLE &&
		transport_state.Transition(TransportState::CONNECTING);

	try {
		av_transport.Invoke("SetAVTransportURI"sv, instance_id.c_str(),
				    {{"CurrentURI", uri},
				     {"CurrentURIMetaData", metadata}});
	} catch (...) {
		if (connecting)
			transport_state.ForceState(TransportState::ERROR);
		throw;
	}

	transport_state.SetInstanceId(instance_id);
	position.UpdateMediaInfo(std::move(metadata), uri);

	if (connecting)
		transport_state.Transition(TransportState::CONNECTED);

	return MakeOkResult();
}

ActionResult
ActionExecutionHandler::GetPositionInfo(const std::string &instance_id) noexcept
{
	PositionInfo info;
	bool degraded = false;

	if (auto values = av_transport.ExecuteSoapAction("GetPositionInfo"sv,
							 instance_id.c_str());
	    values.IsOk()) {
		info = position.Reconcile(*values);
	} else {
		FmtInfo(action_domain, "GetPositionInfo failed, using last known values: {}",
			values.GetError().message);
		info = position.GetPositionInfo();
		degraded = true;
	}

	ActionResult result{
		{"Track", fmt::format("{}", info.track)},
		{"TrackDuration", std::move(info.track_duration)},
		{"TrackMetaData", std::move(info.track_metadata)},
		{"TrackURI", std::move(info.track_uri)},
		{"RelTime", std::move(info.rel_time)},
		{"AbsTime", std::move(info.abs_time)},
		{"RelCount", fmt::format("{}", info.rel_count)},
		{"AbsCount", fmt::format("{}", info.abs_count)},
	};

	if (degraded)
		result.emplace("Degraded", "1");

	return result;
}

ActionResult
ActionExecutionHandler::GetTransportInfo(const std::string &instance_id) noexcept
{
	TransportInfo info;
	bool degraded = false;

	if (auto values = av_transport.ExecuteSoapAction("GetTransportInfo"sv,
							 instance_id.c_str());
	    values.IsOk()) {
		info = transport_state.Reconcile(*values);
	} else {
		FmtInfo(action_domain, "GetTransportInfo failed, using last known values: {}",
			values.GetError().message);
		info = transport_state.GetTransportInfo();
		degraded = true;
	}

	ActionResult result{
		{"CurrentTransportState", std::move(info.state)},
		{"CurrentTransportStatus", std::move(info.status)},
		{"CurrentSpeed", std::move(info.speed)},
		{"TransportState", std::string{ToString(transport_state.GetState())}},
	};

	if (degraded)
		result.emplace("Degraded", "1");

	return result;
}

SoapTransportExecutor &
ActionExecutionHandler::GetRenderingControl(MediaAction action) const
{
	if (rendering_control == nullptr)
		throw CastException(ErrorCategory::COMPATIBILITY,
				    fmt::format("{} is not supported: device has no RenderingControl service",
						GetActionName(action)));

	return *rendering_control;
}

ActionResult
ActionExecutionHandler::GetVolume(const std::string &instance_id)
{
	const auto values = GetRenderingControl(MediaAction::GET_VOLUME)
		.Invoke("GetVolume"sv, instance_id.c_str(),
			{{"Channel", "Master"}});

	auto i = values.find("CurrentVolume");
	if (i == values.end())
		throw CastException(ErrorCategory::PARSING,
				    "No CurrentVolume in GetVolume response");

	unsigned value;
	try {
		value = ParseUnsigned(i->second.c_str());
	} catch (...) {
		std::throw_with_nested(CastException(ErrorCategory::PARSING,
						     "Malformed CurrentVolume"));
	}

	volume.SetVolume(value);
	return {{"CurrentVolume", fmt::format("{}", value)}};
}

ActionResult
ActionExecutionHandler::SetVolume(const std::string &instance_id,
				  const ActionInputs &inputs)
{
	const unsigned value = ParseVolume(RequireInput(inputs, "DesiredVolume"));

	GetRenderingControl(MediaAction::SET_VOLUME)
		.Invoke("SetVolume"sv, instance_id.c_str(),
			{{"Channel", "Master"},
			 {"DesiredVolume", fmt::format("{}", value)}});

	volume.SetVolume(value);
	return MakeOkResult();
}

ActionResult
ActionExecutionHandler::GetMute(const std::string &instance_id)
{
	const auto values = GetRenderingControl(MediaAction::GET_MUTE)
		.Invoke("GetMute"sv, instance_id.c_str(),
			{{"Channel", "Master"}});

	auto i = values.find("CurrentMute");
	if (i == values.end())
		throw CastException(ErrorCategory::PARSING,
				    "No CurrentMute in GetMute response");

	bool muted;
	try {
		muted = ParseBool(i->second.c_str());
	} catch (...) {
		std::throw_with_nested(CastException(ErrorCategory::PARSING,
						     "Malformed CurrentMute"));
	}

	volume.SetMuted(muted);
	return {{"CurrentMute", muted ? "1" : "0"}};
}

ActionResult
ActionExecutionHandler::SetMute(const std::string &instance_id,
				const ActionInputs &inputs)
{
	const bool muted = ParseMute(RequireInput(inputs, "DesiredMute"));

	GetRenderingControl(MediaAction::SET_MUTE)
		.Invoke("SetMute"sv, instance_id.c_str(),
			{{"Channel", "Master"},
			 {"DesiredMute", muted ? "1" : "0"}});

	volume.SetMuted(muted);
	return MakeOkResult();
}
