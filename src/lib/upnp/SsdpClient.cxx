// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "SsdpClient.hxx"
#include "ClientInit.hxx"
#include "error/CastError.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <upnp/upnptools.h>

#include <fmt/format.h>

#include <algorithm>

static constexpr Domain upnp_domain("upnp");

void
UpnpSsdpClient::Open(SsdpHandler &_handler)
{
	{
		const std::scoped_lock protect{mutex};
		if (handler != nullptr)
			return;
	}

	const auto new_handle =
		UpnpClientGlobalInit(iface.empty() ? nullptr : iface.c_str(),
				     *this);

	const std::scoped_lock protect{mutex};
	handle = new_handle;
	handler = &_handler;
}

void
UpnpSsdpClient::Close() noexcept
{
	{
		const std::scoped_lock protect{mutex};
		if (handler == nullptr)
			return;

		handler = nullptr;
	}

	UpnpClientGlobalFinish(*this);
}

void
UpnpSsdpClient::Search(std::string_view target, std::chrono::seconds mx)
{
	const std::string target_string{target};

	int code = UpnpSearchAsync(handle, int(mx.count()),
				   target_string.c_str(), GetUpnpCookie());
	if (code != UPNP_E_SUCCESS)
		throw CastException(ErrorCategory::DISCOVERY,
				    fmt::format("UpnpSearchAsync() failed: {}",
						UpnpGetErrorMessage(code)));
}

static std::string
NullableString(const char *s) noexcept
{
	return s != nullptr ? std::string{s} : std::string{};
}

void
UpnpSsdpClient::Dispatch(SsdpMessage::Type type,
			 const UpnpDiscovery &disco) noexcept
{
	if (UpnpDiscovery_get_ErrCode(&disco) != UPNP_E_SUCCESS)
		return;

	SsdpMessage message{
		type,
		NullableString(UpnpDiscovery_get_DeviceID_cstr(&disco)),
		NullableString(UpnpDiscovery_get_Location_cstr(&disco)),
		NullableString(UpnpDiscovery_get_DeviceType_cstr(&disco)),
		std::chrono::seconds(std::max(UpnpDiscovery_get_Expires(&disco), 0)),
	};

	if (message.type_urn.empty())
		message.type_urn = NullableString(UpnpDiscovery_get_ServiceType_cstr(&disco));

	const std::scoped_lock protect{mutex};
	if (handler != nullptr)
		handler->OnSsdpMessage(message);
}

int
UpnpSsdpClient::Invoke(Upnp_EventType et, const void *evp) noexcept
{
	switch (et) {
	case UPNP_DISCOVERY_SEARCH_RESULT:
		Dispatch(SsdpMessage::Type::RESPONSE,
			 *(const UpnpDiscovery *)evp);
		break;

	case UPNP_DISCOVERY_ADVERTISEMENT_ALIVE:
		Dispatch(SsdpMessage::Type::ALIVE,
			 *(const UpnpDiscovery *)evp);
		break;

	case UPNP_DISCOVERY_ADVERTISEMENT_BYEBYE:
		Dispatch(SsdpMessage::Type::BYEBYE,
			 *(const UpnpDiscovery *)evp);
		break;

	case UPNP_DISCOVERY_SEARCH_TIMEOUT:
		FmtDebug(upnp_domain, "search timeout");
		break;

	default:
		break;
	}

	return UPNP_E_SUCCESS;
}
