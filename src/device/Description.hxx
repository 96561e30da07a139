// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "Device.hxx"

#include <string_view>

/**
 * Parse a UPnP device description document.  Only the root device
 * supplies the identity and metadata; services of embedded devices
 * are collected, too.  Relative URLs are resolved.
 *
 * Throws #ExpatError on malformed XML, #CastException (PARSING) if
 * the document lacks a UDN.
 *
 * @param location the URL the document was downloaded from
 */
Device
ParseDeviceDescription(std::string_view location, std::string_view xml);
