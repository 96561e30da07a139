// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <string>
#include <string_view>

class Device;

/**
 * Guess the MIME type of a media URL from its file name extension.
 * Unknown extensions are assumed to be "video/mp4".
 */
[[gnu::pure]]
std::string_view
GuessMimeType(std::string_view url) noexcept;

/**
 * Build the DIDL-Lite document describing a media item for
 * "SetAVTransportURI".  Some vendors need a slightly different
 * flavor; the #Device is used to choose.
 *
 * @param mime_type the MIME type; if empty, it is guessed from the
 * URL
 */
std::string
BuildDidlLite(const Device &device, std::string_view url,
	      std::string_view title, std::string_view mime_type={}) noexcept;
