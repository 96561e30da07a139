// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Controller.hxx"
#include "Metadata.hxx"
#include "TimeUtil.hxx"
#include "error/CastError.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

static constexpr Domain controller_domain("controller");

static const DeviceService &
RequireAVTransport(const Device &device)
{
	const auto *service = device.GetAVTransport();
	if (service == nullptr || service->control_url.empty())
		throw CastException(ErrorCategory::DEVICE,
				    fmt::format("Device \"{}\" has no AVTransport service",
						device.GetDisplayName()));

	return *service;
}

static std::unique_ptr<SoapTransportExecutor>
MakeRenderingControl(HttpClient &http, const Device &device)
{
	const auto *service = device.GetRenderingControl();
	if (service == nullptr || service->control_url.empty())
		return nullptr;

	return std::make_unique<SoapTransportExecutor>(http, service->control_url,
						       service->type);
}

Controller::Controller(DevicePtr _device, HttpClient &http, WorkQueue &queue,
		       Clock::duration _shutdown_timeout)
	:device(std::move(_device)),
	 av_transport(http, RequireAVTransport(*device).control_url,
		      RequireAVTransport(*device).type),
	 rendering_control(MakeRenderingControl(http, *device)),
	 handler(av_transport, rendering_control.get(),
		 transport_state, position, volume),
	 scope(queue, "controller"),
	 shutdown_timeout(_shutdown_timeout)
{
	FmtDebug(controller_domain, "created controller for \"{}\"",
		 device->GetDisplayName());
}

Controller::~Controller() noexcept = default;

bool
Controller::Submit(MediaAction action, ActionInputs inputs,
		   Callback callback) noexcept
{
	return scope.Submit([self=shared_from_this(), action,
			     inputs=std::move(inputs),
			     callback=std::move(callback)](std::stop_token){
		auto result = self->Execute(action, inputs);
		if (callback)
			callback(std::move(result));
	});
}

ActionResult
Controller::Cast(std::string_view url, std::string_view title,
		 std::chrono::milliseconds start_position) noexcept
{
	FmtInfo(controller_domain, "casting {} to \"{}\"",
		url, device->GetDisplayName());

	auto result = Execute(MediaAction::SET_AV_TRANSPORT_URI, {
			{"CurrentURI", std::string{url}},
			{"CurrentURIMetaData", BuildDidlLite(*device, url, title)},
		});
	if (ActionExecutionHandler::IsError(result))
		return result;

	result = Execute(MediaAction::PLAY);
	if (ActionExecutionHandler::IsError(result))
		return result;

	if (start_position.count() > 0) {
		const auto seek = Execute(MediaAction::SEEK, {
				{"Target", FormatUpnpTime(start_position)},
			});
		if (ActionExecutionHandler::IsError(seek))
			FmtWarning(controller_domain, "failed to seek on \"{}\"",
				   device->GetDisplayName());
	}

	return result;
}

VolumeState::Snapshot
Controller::GetVolumeState(Clock::duration max_age) noexcept
{
	if (HasRenderingControl()) {
		if (!volume.GetFreshVolume(max_age))
			Execute(MediaAction::GET_VOLUME);

		if (!volume.GetFreshMuted(max_age))
			Execute(MediaAction::GET_MUTE);
	}

	return volume.Get();
}

void
Controller::Release() noexcept
{
	if (!scope.CancelAndWait(shutdown_timeout))
		FmtWarning(controller_domain,
			   "tasks of \"{}\" did not finish in time",
			   device->GetDisplayName());

	av_transport.Release();
	if (rendering_control)
		rendering_control->Release();
}
