// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "SoapEnvelope.hxx"
#include "error/CastError.hxx"
#include "lib/expat/ExpatParser.hxx"
#include "util/StringUtil.hxx"

#include <fmt/format.h>

#include <charconv>

std::string
SoapFault::ToString() const noexcept
{
	std::string result = string.empty() ? code : string;

	if (upnp_error_code != 0) {
		result += fmt::format(" (UPnP error {}", upnp_error_code);
		if (!upnp_error_description.empty()) {
			result += ": ";
			result += upnp_error_description;
		}
		result += ')';
	} else if (!upnp_error_description.empty()) {
		result += " (";
		result += upnp_error_description;
		result += ')';
	}

	return result;
}

std::string
XmlEscape(std::string_view s) noexcept
{
	std::string result;
	result.reserve(s.size());

	for (const char ch : s) {
		switch (ch) {
		case '&':
			result += "&amp;";
			break;

		case '<':
			result += "&lt;";
			break;

		case '>':
			result += "&gt;";
			break;

		case '"':
			result += "&quot;";
			break;

		case '\'':
			result += "&apos;";
			break;

		default:
			result.push_back(ch);
		}
	}

	return result;
}

std::string
FormatSoapRequest(std::string_view service_type, std::string_view action,
		  const char *instance_id, const SoapArguments &args) noexcept
{
	std::string body =
		"<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
		"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\""
		" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">\n"
		"<s:Body>";

	body += fmt::format("<u:{} xmlns:u=\"{}\">", action, service_type);

	if (instance_id != nullptr)
		body += fmt::format("<InstanceID>{}</InstanceID>",
				    XmlEscape(instance_id));

	for (const auto &[name, value] : args)
		body += fmt::format("<{0}>{1}</{0}>", name, XmlEscape(value));

	body += fmt::format("</u:{}></s:Body></s:Envelope>", action);
	return body;
}

std::string
FormatSoapAction(std::string_view service_type,
		 std::string_view action) noexcept
{
	return fmt::format("\"{}#{}\"", service_type, action);
}

namespace {

/**
 * Collects the children of the first element inside <Body>, or the
 * fault details.
 */
class SoapResponseParser final : public CommonExpatParser {
	SoapResponse &response;

	std::vector<std::string> path;

	/**
	 * The index of the <Body> element in #path, or 0 if it has not
	 * been seen yet.
	 */
	std::size_t body_depth = 0;

	std::string value;

public:
	bool seen_envelope = false;

	explicit SoapResponseParser(SoapResponse &_response) noexcept
		:response(_response) {}

protected:
	void StartElement(const XML_Char *name, const XML_Char **) override {
		path.emplace_back(StripXmlPrefix(name));
		value.clear();

		if (path.size() == 1)
			seen_envelope = path.back() == "Envelope";
		else if (path.size() == 2 && path.back() == "Body")
			body_depth = 1;
		else if (body_depth > 0 && path.size() == 3 &&
			 path.back() == "Fault")
			response.fault.emplace();
	}

	void EndElement(const XML_Char *) override {
		if (path.empty())
			return;

		const std::string_view v = Strip(value);

		if (response.fault)
			OnFaultValue(path.back(), v);
		else if (body_depth > 0 && path.size() == 4)
			response.values.insert_or_assign(path.back(),
							 std::string{v});

		value.clear();
		path.pop_back();
	}

	void CharacterData(const XML_Char *s, int len) override {
		value.append(s, len);
	}

private:
	void OnFaultValue(std::string_view name, std::string_view v) noexcept {
		auto &fault = *response.fault;

		if (name == "faultcode")
			fault.code = v;
		else if (name == "faultstring")
			fault.string = v;
		else if (name == "errorCode") {
			unsigned code;
			auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(),
							 code);
			if (ec == std::errc{} && ptr == v.data() + v.size())
				fault.upnp_error_code = code;
		} else if (name == "errorDescription")
			fault.upnp_error_description = v;
	}
};

} // anonymous namespace

SoapResponse
ParseSoapResponse(std::string_view body)
{
	SoapResponse response;

	{
		SoapResponseParser parser(response);
		parser.Parse(body, true);

		if (!parser.seen_envelope)
			throw CastException(ErrorCategory::PARSING,
					    "Not a SOAP envelope");
	}

	return response;
}
