// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Classify.hxx"
#include "Device.hxx"
#include "util/StringUtil.hxx"

#include <initializer_list>

[[gnu::pure]]
static bool
MatchesAny(const Device &device,
	   std::initializer_list<std::string_view> keywords) noexcept
{
	for (const auto keyword : keywords)
		if (StringContainsIgnoreCase(device.manufacturer, keyword) ||
		    StringContainsIgnoreCase(device.model_name, keyword))
			return true;

	return false;
}

DeviceKind
ClassifyDevice(const Device &device) noexcept
{
	if (MatchesAny(device, {"tv", "samsung", "lg", "sony", "xiaomi"}))
		return DeviceKind::TV;

	if (MatchesAny(device, {"box", "roku", "apple"}))
		return DeviceKind::BOX;

	return DeviceKind::OTHER;
}
