// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Device.hxx"
#include "ServiceTypes.hxx"
#include "Util.hxx"
#include "util/StringUtil.hxx"

bool
IsSameUpnpType(std::string_view a, std::string_view b) noexcept
{
	const auto a_colon = a.rfind(':');
	const auto b_colon = b.rfind(':');
	if (a_colon == a.npos || b_colon == b.npos)
		return a == b;

	return a.substr(0, a_colon) == b.substr(0, b_colon);
}

const DeviceService *
Device::FindService(std::string_view type) const noexcept
{
	for (const auto &service : services)
		if (IsSameUpnpType(service.type, type))
			return &service;

	return nullptr;
}

const DeviceService *
Device::GetAVTransport() const noexcept
{
	return FindService(av_transport_service_type);
}

const DeviceService *
Device::GetRenderingControl() const noexcept
{
	return FindService(rendering_control_service_type);
}

bool
Device::IsMediaRenderer() const noexcept
{
	return StringContainsIgnoreCase(device_type, "MediaRenderer") ||
		GetAVTransport() != nullptr;
}

std::string_view
Device::GetDisplayName() const noexcept
{
	if (!friendly_name.empty())
		return friendly_name;

	if (!model_name.empty())
		return model_name;

	return udn;
}

std::string_view
Device::GetAddress() const noexcept
{
	return GetUrlHost(location);
}

bool
Device::IsSameMetadata(const Device &other) const noexcept
{
	if (location != other.location ||
	    device_type != other.device_type ||
	    friendly_name != other.friendly_name ||
	    manufacturer != other.manufacturer ||
	    model_name != other.model_name ||
	    model_number != other.model_number ||
	    url_base != other.url_base ||
	    services.size() != other.services.size())
		return false;

	for (std::size_t i = 0; i < services.size(); ++i) {
		const auto &a = services[i], &b = other.services[i];
		if (a.type != b.type || a.id != b.id ||
		    a.control_url != b.control_url ||
		    a.event_sub_url != b.event_sub_url ||
		    a.scpd_url != b.scpd_url)
			return false;
	}

	return true;
}
