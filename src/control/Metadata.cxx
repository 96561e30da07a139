// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Metadata.hxx"
#include "SoapEnvelope.hxx"
#include "device/Device.hxx"
#include "device/Util.hxx"
#include "util/StringUtil.hxx"

#include <fmt/format.h>

#include <array>
#include <utility>

using std::string_view_literals::operator""sv;

static constexpr std::array mime_types{
	std::pair{"mp4"sv, "video/mp4"sv},
	std::pair{"m3u8"sv, "application/x-mpegURL"sv},
	std::pair{"mkv"sv, "video/x-matroska"sv},
	std::pair{"avi"sv, "video/x-msvideo"sv},
	std::pair{"mov"sv, "video/quicktime"sv},
	std::pair{"flv"sv, "video/x-flv"sv},
	std::pair{"mp3"sv, "audio/mpeg"sv},
	std::pair{"aac"sv, "audio/aac"sv},
	std::pair{"wav"sv, "audio/wav"sv},
	std::pair{"jpg"sv, "image/jpeg"sv},
	std::pair{"jpeg"sv, "image/jpeg"sv},
	std::pair{"png"sv, "image/png"sv},
	std::pair{"gif"sv, "image/gif"sv},
};

std::string_view
GuessMimeType(std::string_view url) noexcept
{
	const auto extension = GetUrlExtension(url);

	for (const auto &[suffix, mime_type] : mime_types)
		if (extension == suffix)
			return mime_type;

	return "video/mp4"sv;
}

[[gnu::pure]]
static std::string_view
GetUpnpClass(std::string_view mime_type) noexcept
{
	if (mime_type.starts_with("audio/"sv))
		return "object.item.audioItem.musicTrack"sv;
	else if (mime_type.starts_with("image/"sv))
		return "object.item.imageItem.photo"sv;
	else
		return "object.item.videoItem"sv;
}

[[gnu::pure]]
static bool
IsXiaomi(const Device &device) noexcept
{
	return StringContainsIgnoreCase(device.manufacturer, "xiaomi"sv);
}

[[gnu::pure]]
static bool
IsSamsung(const Device &device) noexcept
{
	return StringContainsIgnoreCase(device.manufacturer, "samsung"sv) ||
		StringContainsIgnoreCase(device.friendly_name, "samsung"sv);
}

static constexpr std::string_view didl_namespaces =
	"xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\""
	" xmlns:dc=\"http://purl.org/dc/elements/1.1/\""
	" xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\""sv;

static constexpr std::string_view dlna_namespace =
	" xmlns:dlna=\"urn:schemas-dlna-org:metadata-1-0/\""sv;

/**
 * Samsung renderers refuse to play unless the DLNA flags are
 * present.
 */
static constexpr std::string_view samsung_dlna_features =
	"DLNA.ORG_OP=01;DLNA.ORG_CI=0;DLNA.ORG_FLAGS=01700000000000000000000000000000"sv;

std::string
BuildDidlLite(const Device &device, std::string_view url,
	      std::string_view title, std::string_view mime_type) noexcept
{
	if (mime_type.empty())
		mime_type = GuessMimeType(url);

	const bool xiaomi = IsXiaomi(device);
	const bool samsung = !xiaomi && IsSamsung(device);

	std::string creator;
	if (samsung)
		creator = "<dc:creator>Video Player</dc:creator>";

	return fmt::format("<DIDL-Lite {}{}>"
			   "<item id=\"0\" parentID=\"-1\" restricted=\"1\">"
			   "<dc:title>{}</dc:title>"
			   "<upnp:class>{}</upnp:class>"
			   "{}"
			   "<res protocolInfo=\"http-get:*:{}:{}\">{}</res>"
			   "</item></DIDL-Lite>",
			   didl_namespaces,
			   xiaomi ? std::string_view{} : dlna_namespace,
			   XmlEscape(title),
			   GetUpnpClass(mime_type),
			   creator,
			   mime_type,
			   samsung ? samsung_dlna_features : "*"sv,
			   XmlEscape(url));
}
