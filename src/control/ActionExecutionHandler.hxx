// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "MediaAction.hxx"
#include "TransportState.hxx"

#include <string_view>

struct CastError;
class SoapTransportExecutor;
class TransportStateManager;
class PositionInfoManager;
class VolumeState;

/**
 * Translates a #MediaAction with its inputs into SOAP calls, and
 * keeps the state managers up to date.
 *
 * Transport transitions are validated before the request is sent:
 * an invalid transition fails with a PLAYBACK error and no SOAP
 * traffic.  The read actions ("GetPositionInfo",
 * "GetTransportInfo") fall back to the last known values when the
 * renderer cannot be reached; such a result has the key
 * "Degraded".
 */
class ActionExecutionHandler {
	SoapTransportExecutor &av_transport;

	/**
	 * nullptr if the device has no RenderingControl service.
	 */
	SoapTransportExecutor *const rendering_control;

	TransportStateManager &transport_state;
	PositionInfoManager &position;
	VolumeState &volume;

public:
	ActionExecutionHandler(SoapTransportExecutor &_av_transport,
			       SoapTransportExecutor *_rendering_control,
			       TransportStateManager &_transport_state,
			       PositionInfoManager &_position,
			       VolumeState &_volume) noexcept
		:av_transport(_av_transport),
		 rendering_control(_rendering_control),
		 transport_state(_transport_state),
		 position(_position), volume(_volume) {}

	ActionExecutionHandler(const ActionExecutionHandler &) = delete;
	ActionExecutionHandler &operator=(const ActionExecutionHandler &) = delete;

	/**
	 * Execute an action.  Never throws; errors are reported in the
	 * result with the keys "Error", "ErrorCategory" and
	 * "ErrorCode".
	 */
	ActionResult Execute(MediaAction action,
			     const ActionInputs &inputs={}) noexcept;

	/**
	 * Look up the action by name and execute it.  An unknown name
	 * yields {"Error": "unknown action"}.
	 */
	ActionResult Execute(std::string_view action_name,
			     const ActionInputs &inputs={}) noexcept;

	static ActionResult MakeErrorResult(const CastError &error) noexcept;

	[[gnu::pure]]
	static bool IsError(const ActionResult &result) noexcept {
		return result.contains("Error");
	}

private:
	/**
	 * Throws on error.
	 */
	ActionResult Dispatch(MediaAction action, const ActionInputs &inputs);

	void CheckTransition(MediaAction action, TransportState to) const;

	ActionResult Play(const std::string &instance_id,
			  const ActionInputs &inputs);
	ActionResult Pause(const std::string &instance_id);
	ActionResult Stop(const std::string &instance_id);
	ActionResult Seek(const std::string &instance_id,
			  const ActionInputs &inputs);
	ActionResult SetAVTransportURI(const std::string &instance_id,
				       const ActionInputs &inputs);

	ActionResult GetPositionInfo(const std::string &instance_id) noexcept;
	ActionResult GetTransportInfo(const std::string &instance_id) noexcept;

	SoapTransportExecutor &GetRenderingControl(MediaAction action) const;

	ActionResult GetVolume(const std::string &instance_id);
	ActionResult SetVolume(const std::string &instance_id,
			       const ActionInputs &inputs);
	ActionResult GetMute(const std::string &instance_id);
	ActionResult SetMute(const std::string &instance_id,
			     const ActionInputs &inputs);
};
