// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Instance.hxx"
#include "control/ActionExecutionHandler.hxx"
#include "control/Controller.hxx"
#include "control/TimeUtil.hxx"
#include "device/Classify.hxx"
#include "error/CastError.hxx"
#include "util/Domain.hxx"
#include "util/StringUtil.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <algorithm>

static constexpr Domain instance_domain("instance");

DeviceInfo
MakeDeviceInfo(const Device &device) noexcept
{
	const auto kind = ClassifyDevice(device);

	return {
		device.GetUdn(),
		std::string{device.GetDisplayName()},
		std::string{device.GetAddress()},
		kind == DeviceKind::TV,
		GetDevicePriority(kind),
	};
}

[[gnu::pure]]
static bool
IsDigits(std::string_view s) noexcept
{
	return !s.empty() &&
		std::all_of(s.begin(), s.end(), [](char ch){
			return ch >= '0' && ch <= '9';
		});
}

ActionInputs
MakeActionInputs(MediaAction action, std::string_view value)
{
	switch (action) {
	case MediaAction::SET_VOLUME:
		return {{"DesiredVolume", std::string{value}}};

	case MediaAction::SET_MUTE:
		/* no value means "mute" */
		return {{"DesiredMute", value.empty() ? std::string{"1"} : std::string{value}}};

	case MediaAction::SEEK:
		if (IsDigits(value))
			/* milliseconds */
			return {{"Target", FormatUpnpTime(std::chrono::milliseconds(std::stoull(std::string{value})))}};

		return {{"Target", std::string{value}}};

	case MediaAction::SET_AV_TRANSPORT_URI:
		if (value.empty())
			throw CastException(ErrorCategory::INVALID_PARAMETER,
					    "No URI specified");

		return {{"CurrentURI", std::string{value}}};

	case MediaAction::PLAY:
	case MediaAction::PAUSE:
	case MediaAction::STOP:
	case MediaAction::GET_POSITION_INFO:
	case MediaAction::GET_TRANSPORT_INFO:
	case MediaAction::GET_VOLUME:
	case MediaAction::GET_MUTE:
		break;
	}

	return {};
}

Instance::Instance(const CastConfig &_config, SsdpClient &ssdp,
		   HttpClient &http, MulticastLock &multicast_lock)
	:config(_config),
	 queue("upnpcast", config.worker_threads),
	 cache(config.max_devices, config.tombstone_grace),
	 registry(cache),
	 factory(registry, http, queue, config),
	 router(ssdp, multicast_lock, registry, http, queue, config),
	 scope(queue, "instance")
{
	router.SetObserver(this);
}

std::vector<DeviceInfo>
Instance::GetDevices() const noexcept
{
	std::vector<DeviceInfo> result;

	for (const auto &device : registry.GetAllDevices())
		result.emplace_back(MakeDeviceInfo(*device));

	std::stable_sort(result.begin(), result.end(),
			 [](const DeviceInfo &a, const DeviceInfo &b){
				 if (a.priority != b.priority)
					 return a.priority > b.priority;
				 return a.name < b.name;
			 });

	return result;
}

DevicePtr
Instance::ResolveDevice(const std::string &udn, std::stop_token token)
{
	if (auto device = registry.GetDeviceById(udn))
		return device;

	FmtInfo(instance_domain, "device {} not found, searching", udn);

	router.Search();

	if (TaskScope::SleepFor(token, config.retry_delay))
		if (auto device = registry.GetDeviceById(udn))
			return device;

	if (registry.IsTombstoned(udn))
		throw CastException(ErrorCategory::DEVICE_CONNECTION,
				    fmt::format("Device {} has disappeared", udn));

	throw CastException(ErrorCategory::INVALID_PARAMETER,
			    fmt::format("No such device: {}", udn));
}

bool
Instance::Cast(std::string udn, std::string url, std::string title,
	       Callback callback,
	       std::chrono::milliseconds start_position) noexcept
{
	return scope.Submit([this, udn=std::move(udn), url=std::move(url),
			     title=std::move(title), start_position,
			     callback=std::move(callback)](std::stop_token token){
		DoCast(udn, url, title, start_position, callback, token);
	});
}

void
Instance::DoCast(const std::string &udn, const std::string &url,
		 const std::string &title,
		 std::chrono::milliseconds start_position,
		 const Callback &callback, std::stop_token token) noexcept
{
	ActionResult result;

	try {
		const auto device = ResolveDevice(udn, token);
		const auto controller = factory.GetController(device);

		{
			const std::scoped_lock protect{mutex};
			current_udn = udn;
		}

		result = controller->Cast(url, title, start_position);
	} catch (...) {
		const auto error = MakeCastError(std::current_exception());
		LogCastError(LogLevel::ERROR, instance_domain,
			     fmt::format("Failed to cast to {}", udn), error);
		result = ActionExecutionHandler::MakeErrorResult(error);
	}

	if (callback)
		callback(std::move(result));
}

bool
Instance::Control(MediaAction action, std::string value,
		  Callback callback) noexcept
{
	return scope.Submit([this, action, value=std::move(value),
			     callback=std::move(callback)](std::stop_token token){
		DoControl(action, value, callback, token);
	});
}

void
Instance::DoControl(MediaAction action, const std::string &value,
		    const Callback &callback, std::stop_token token) noexcept
{
	ActionResult result;

	try {
		const auto udn = GetCurrentUdn();
		if (udn.empty())
			throw CastException(ErrorCategory::INVALID_PARAMETER,
					    "No device selected");

		auto inputs = MakeActionInputs(action, value);
		const auto device = ResolveDevice(udn, token);
		const auto controller = factory.GetController(device);
		result = controller->Execute(action, inputs);
	} catch (...) {
		const auto error = MakeCastError(std::current_exception());
		LogCastError(LogLevel::ERROR, instance_domain,
			     fmt::format("{} failed", GetActionName(action)), error);
		result = ActionExecutionHandler::MakeErrorResult(error);
	}

	if (callback)
		callback(std::move(result));
}

CastStatus
Instance::GetState() const noexcept
{
	CastStatus status;

	const auto udn = GetCurrentUdn();
	if (udn.empty())
		return status;

	const auto device = registry.GetDeviceById(udn);
	if (!device)
		return status;

	status.connected = true;
	status.device = MakeDeviceInfo(*device);

	if (const auto controller = factory.FindController(udn)) {
		status.state = controller->GetTransportState();

		const auto volume = controller->GetCachedVolumeState();
		status.volume = volume.volume;
		status.muted = volume.muted;
	}

	return status;
}

void
Instance::Release() noexcept
{
	{
		const std::scoped_lock protect{mutex};
		if (released)
			return;

		released = true;
		current_udn.clear();
	}

	router.Shutdown();
	factory.ClearAll();

	if (!scope.CancelAndWait(config.shutdown_timeout))
		LogWarning(instance_domain, "pending operations did not finish in time");

	/* drop controllers created by operations which were in flight */
	factory.ClearAll();

	queue.SetTerminateAndWait(config.shutdown_timeout);
}

void
Instance::OnSearchStarted() noexcept
{
	LogDebug(instance_domain, "search started");

	if (observer != nullptr)
		observer->OnSearchStarted();
}

void
Instance::OnSearchFinished() noexcept
{
	FmtDebug(instance_domain, "search finished, {} devices",
		 registry.GetDeviceCount());

	if (observer != nullptr)
		observer->OnSearchFinished();
}

void
Instance::OnDiscoveryError(const CastError &error) noexcept
{
	LogCastError(LogLevel::WARNING, instance_domain, "discovery", error);

	if (observer != nullptr)
		observer->OnDiscoveryError(error);
}
