// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "ControllerFactory.hxx"
#include "Controller.hxx"
#include "config/CastConfig.hxx"
#include "device/DeviceRegistry.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <vector>

static constexpr Domain factory_domain("controller_factory");

ControllerFactory::ControllerFactory(DeviceRegistry &_registry,
				     HttpClient &_http, WorkQueue &_queue,
				     const CastConfig &config) noexcept
	:registry(_registry), http(_http), queue(_queue),
	 shutdown_timeout(config.shutdown_timeout)
{
	registry.AddListener(*this);
}

ControllerFactory::~ControllerFactory() noexcept
{
	registry.RemoveListener(*this);
	ClearAll();
}

std::shared_ptr<Controller>
ControllerFactory::GetController(const DevicePtr &device)
{
	const std::scoped_lock protect{mutex};

	auto i = controllers.find(device->GetUdn());
	if (i != controllers.end()) {
		const auto *service = device->GetAVTransport();
		if (service != nullptr &&
		    service->control_url == i->second->GetControlUrl())
			return i->second;

		/* the device has moved; start over */
		i->second->Cancel();
		controllers.erase(i);
	}

	auto controller = std::make_shared<Controller>(device, http, queue,
						       shutdown_timeout);
	controllers.emplace(device->GetUdn(), controller);
	return controller;
}

std::shared_ptr<Controller>
ControllerFactory::FindController(std::string_view udn) const noexcept
{
	const std::scoped_lock protect{mutex};

	auto i = controllers.find(udn);
	return i != controllers.end() ? i->second : nullptr;
}

DevicePtr
ControllerFactory::GetDeviceByUSN(const std::string &udn) const noexcept
{
	return registry.GetDeviceById(udn);
}

bool
ControllerFactory::RemoveController(std::string_view udn) noexcept
{
	std::shared_ptr<Controller> controller;

	{
		const std::scoped_lock protect{mutex};

		auto i = controllers.find(udn);
		if (i == controllers.end())
			return false;

		controller = std::move(i->second);
		controllers.erase(i);
	}

	controller->Release();
	return true;
}

void
ControllerFactory::ClearAll() noexcept
{
	std::vector<std::shared_ptr<Controller>> removed;

	{
		const std::scoped_lock protect{mutex};
		for (auto &[udn, controller] : controllers)
			removed.emplace_back(std::move(controller));
		controllers.clear();
	}

	/* cancel all of them first, so they shut down in parallel */
	for (const auto &controller : removed)
		controller->Cancel();

	for (const auto &controller : removed)
		controller->Release();
}

void
ControllerFactory::Detach(const std::string &udn) noexcept
{
	std::shared_ptr<Controller> controller;

	{
		const std::scoped_lock protect{mutex};

		auto i = controllers.find(udn);
		if (i == controllers.end())
			return;

		controller = std::move(i->second);
		controllers.erase(i);
	}

	FmtDebug(factory_domain, "dropping controller for {}", udn);
	controller->Cancel();
}

void
ControllerFactory::OnDeviceAdded(const DevicePtr &) noexcept
{
}

void
ControllerFactory::OnDeviceUpdated(const DevicePtr &device) noexcept
{
	const auto controller = FindController(device->GetUdn());
	if (!controller)
		return;

	const auto *service = device->GetAVTransport();
	if (service == nullptr ||
	    service->control_url != controller->GetControlUrl())
		Detach(device->GetUdn());
}

void
ControllerFactory::OnDeviceRemoved(const DevicePtr &device) noexcept
{
	Detach(device->GetUdn());
}

void
ControllerFactory::OnDeviceListUpdated(const DeviceList &) noexcept
{
}
