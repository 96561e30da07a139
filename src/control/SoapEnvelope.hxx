// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * Action arguments in the order they are sent.
 */
using SoapArguments = std::vector<std::pair<std::string, std::string>>;

/**
 * Output arguments of an action response.
 */
using SoapValues = std::map<std::string, std::string, std::less<>>;

struct SoapFault {
	std::string code;
	std::string string;

	/**
	 * The UPnP error code from the "UPnPError" detail; 0 if none.
	 */
	unsigned upnp_error_code = 0;

	std::string upnp_error_description;

	std::string ToString() const noexcept;
};

struct SoapResponse {
	std::optional<SoapFault> fault;

	SoapValues values;
};

/**
 * Escape the XML special characters.
 */
std::string
XmlEscape(std::string_view s) noexcept;

/**
 * Build the SOAP envelope of a UPnP action request.  The
 * "InstanceID" argument comes first; it is omitted if
 * #instance_id is nullptr.
 */
std::string
FormatSoapRequest(std::string_view service_type, std::string_view action,
		  const char *instance_id, const SoapArguments &args) noexcept;

/**
 * The value of the "SOAPAction" request header, including the double
 * quotes.
 */
std::string
FormatSoapAction(std::string_view service_type,
		 std::string_view action) noexcept;

/**
 * Parse a SOAP response body.
 *
 * Throws #ExpatError on malformed XML and #CastException (PARSING) if
 * the document is not a SOAP envelope.
 */
SoapResponse
ParseSoapResponse(std::string_view body);
