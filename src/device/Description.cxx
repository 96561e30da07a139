// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Description.hxx"
#include "Util.hxx"
#include "error/CastError.hxx"
#include "lib/expat/ExpatParser.hxx"
#include "util/StringUtil.hxx"

#include <string.h>

namespace {

struct ParsedDescription {
	std::string udn;
	std::string device_type;
	std::string friendly_name;
	std::string manufacturer;
	std::string model_name;
	std::string model_number;
	std::string url_base;

	std::vector<DeviceService> services;
};

/**
 * An XML parser which constructs a #ParsedDescription from a device
 * description.
 */
class DeviceDescriptionParser final : public CommonExpatParser {
	ParsedDescription &description;

	/**
	 * The local names of all open elements.
	 */
	std::vector<std::string> path;

	/**
	 * Nesting level of <device> elements; 1 is the root device.
	 */
	unsigned device_depth = 0;

	std::string value;

	DeviceService service;

public:
	explicit DeviceDescriptionParser(ParsedDescription &_description) noexcept
		:description(_description) {}

protected:
	void StartElement(const XML_Char *name, const XML_Char **) override {
		path.emplace_back(StripXmlPrefix(name));
		value.clear();

		if (path.back() == "device")
			++device_depth;
	}

	void EndElement(const XML_Char *) override {
		if (path.empty())
			return;

		OnElementValue(path.back(), Strip(value));
		value.clear();

		if (path.back() == "device")
			--device_depth;
		else if (path.back() == "service") {
			description.services.emplace_back(std::move(service));
			service = {};
		}

		path.pop_back();
	}

	void CharacterData(const XML_Char *s, int len) override {
		value.append(s, len);
	}

private:
	[[gnu::pure]]
	bool IsInService() const noexcept {
		return path.size() >= 2 && path[path.size() - 2] == "service";
	}

	void OnElementValue(std::string_view name, std::string_view v) {
		if (IsInService()) {
			if (name == "serviceType")
				service.type = v;
			else if (name == "serviceId")
				service.id = v;
			else if (name == "controlURL")
				service.control_url = v;
			else if (name == "eventSubURL")
				service.event_sub_url = v;
			else if (name == "SCPDURL")
				service.scpd_url = v;
			return;
		}

		if (name == "URLBase" && path.size() == 2) {
			description.url_base = v;
			return;
		}

		if (device_depth != 1 ||
		    path.size() < 2 || path[path.size() - 2] != "device")
			return;

		if (name == "UDN")
			description.udn = v;
		else if (name == "deviceType")
			description.device_type = v;
		else if (name == "friendlyName")
			description.friendly_name = v;
		else if (name == "manufacturer")
			description.manufacturer = v;
		else if (name == "modelName")
			description.model_name = v;
		else if (name == "modelNumber")
			description.model_number = v;
	}
};

} // anonymous namespace

/**
 * Without <URLBase>, relative URLs are relative to the directory of
 * the description document.
 */
static std::string
DeriveUrlBase(std::string_view location) noexcept
{
	const auto host = GetUrlHost(location);
	if (host.empty())
		return std::string{location};

	return GetParentUrl(location);
}

Device
ParseDeviceDescription(std::string_view location, std::string_view xml)
{
	ParsedDescription parsed;

	{
		DeviceDescriptionParser parser(parsed);
		parser.Parse(xml, true);
	}

	if (parsed.udn.empty())
		throw CastException(ErrorCategory::PARSING,
				    "No UDN in device description");

	Device device(std::move(parsed.udn));
	device.location = location;
	device.device_type = std::move(parsed.device_type);
	device.friendly_name = std::move(parsed.friendly_name);
	device.manufacturer = std::move(parsed.manufacturer);
	device.model_name = std::move(parsed.model_name);
	device.model_number = std::move(parsed.model_number);
	device.url_base = parsed.url_base.empty()
		? DeriveUrlBase(location)
		: std::move(parsed.url_base);

	for (auto &service : parsed.services) {
		service.control_url = ResolveUrl(device.url_base, service.control_url);
		service.event_sub_url = ResolveUrl(device.url_base, service.event_sub_url);
		service.scpd_url = ResolveUrl(device.url_base, service.scpd_url);
		device.services.emplace_back(std::move(service));
	}

	return device;
}
