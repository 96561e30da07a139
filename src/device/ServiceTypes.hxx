// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <string_view>

static constexpr std::string_view media_renderer_device_type =
	"urn:schemas-upnp-org:device:MediaRenderer:1";

static constexpr std::string_view av_transport_service_type =
	"urn:schemas-upnp-org:service:AVTransport:1";

static constexpr std::string_view rendering_control_service_type =
	"urn:schemas-upnp-org:service:RenderingControl:1";

/**
 * Compare two UPnP type strings ignoring the version suffix, e.g.
 * "urn:schemas-upnp-org:service:AVTransport:2" matches
 * "urn:schemas-upnp-org:service:AVTransport:1".
 */
[[gnu::pure]]
bool
IsSameUpnpType(std::string_view a, std::string_view b) noexcept;
