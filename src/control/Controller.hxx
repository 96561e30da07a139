// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "ActionExecutionHandler.hxx"
#include "PositionInfoManager.hxx"
#include "SoapTransportExecutor.hxx"
#include "TransportStateManager.hxx"
#include "VolumeState.hxx"
#include "device/Device.hxx"
#include "thread/TaskScope.hxx"

#include <chrono>
#include <functional>
#include <memory>
#include <string_view>

class HttpClient;
class WorkQueue;

/**
 * Controls one renderer: owns the SOAP executors for its services,
 * the state managers and a #TaskScope for asynchronous actions.
 *
 * Instances are managed by #ControllerFactory, which creates at most
 * one per UDN.  Asynchronous tasks hold a reference, so a controller
 * lives at least until its tasks have finished.
 */
class Controller final : public std::enable_shared_from_this<Controller> {
public:
	using Clock = std::chrono::steady_clock;

	using Callback = std::function<void(ActionResult &&result)>;

private:
	const DevicePtr device;

	SoapTransportExecutor av_transport;

	/**
	 * nullptr if the device has no RenderingControl service.
	 */
	const std::unique_ptr<SoapTransportExecutor> rendering_control;

	TransportStateManager transport_state;
	PositionInfoManager position;
	VolumeState volume;

	ActionExecutionHandler handler;

	TaskScope scope;

	const Clock::duration shutdown_timeout;

public:
	/**
	 * Throws #CastException (DEVICE) if the device has no
	 * AVTransport service.
	 */
	Controller(DevicePtr _device, HttpClient &http, WorkQueue &queue,
		   Clock::duration _shutdown_timeout);

	~Controller() noexcept;

	Controller(const Controller &) = delete;
	Controller &operator=(const Controller &) = delete;

	const DevicePtr &GetDevice() const noexcept {
		return device;
	}

	[[gnu::pure]]
	const std::string &GetUdn() const noexcept {
		return device->GetUdn();
	}

	[[gnu::pure]]
	const std::string &GetControlUrl() const noexcept {
		return av_transport.GetControlUrl();
	}

	[[gnu::pure]]
	bool HasRenderingControl() const noexcept {
		return rendering_control != nullptr;
	}

	[[gnu::pure]]
	TransportState GetTransportState() const noexcept {
		return transport_state.GetState();
	}

	PositionInfo GetPositionInfo() const noexcept {
		return position.GetPositionInfo();
	}

	/**
	 * Execute an action synchronously in the calling thread.
	 */
	ActionResult Execute(MediaAction action,
			     const ActionInputs &inputs={}) noexcept {
		return handler.Execute(action, inputs);
	}

	ActionResult Execute(std::string_view action_name,
			     const ActionInputs &inputs={}) noexcept {
		return handler.Execute(action_name, inputs);
	}

	/**
	 * Execute an action asynchronously on the #WorkQueue.  The
	 * callback is invoked in the worker thread; it is not invoked
	 * if the task is cancelled before it starts.
	 *
	 * @return false if the controller has been cancelled
	 */
	bool Submit(MediaAction action, ActionInputs inputs,
		    Callback callback) noexcept;

	/**
	 * Load a media URL and start playback: "SetAVTransportURI" with
	 * DIDL-Lite metadata, "Play" and, if #position is non-zero,
	 * "Seek".  A failed "Seek" is only logged.
	 *
	 * @return the result of the first failed action, or
	 * {"Result": "OK"}
	 */
	ActionResult Cast(std::string_view url, std::string_view title,
			  std::chrono::milliseconds start_position={}) noexcept;

	/**
	 * Return the volume and mute state.  The RenderingControl
	 * service is queried only if the cached values are older than
	 * #max_age.
	 */
	VolumeState::Snapshot GetVolumeState(Clock::duration max_age=VolumeState::DEFAULT_MAX_AGE) noexcept;

	/**
	 * The cached volume and mute state, without querying the
	 * device.
	 */
	VolumeState::Snapshot GetCachedVolumeState() const noexcept {
		return volume.Get();
	}

	/**
	 * Cancel all asynchronous tasks, without waiting.
	 */
	void Cancel() noexcept {
		scope.RequestStop();
	}

	[[gnu::pure]]
	bool IsCancelled() const noexcept {
		return scope.IsStopRequested();
	}

	/**
	 * Cancel all tasks, wait for them to finish (up to the shutdown
	 * timeout) and close the HTTP connections.
	 */
	void Release() noexcept;
};
