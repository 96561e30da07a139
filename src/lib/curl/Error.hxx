// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "error/CastError.hxx"

#include <curl/curl.h>

/**
 * Map a CURLcode to an #ErrorCategory.
 */
constexpr ErrorCategory
GetCurlErrorCategory(CURLcode code) noexcept
{
	switch (code) {
	case CURLE_OPERATION_TIMEDOUT:
		return ErrorCategory::NETWORK_TIMEOUT;

	case CURLE_COULDNT_CONNECT:
		return ErrorCategory::CONNECTION;

	default:
		return ErrorCategory::NETWORK;
	}
}

/**
 * An error reported by libcurl.
 */
class CurlError final : public CastException {
	CURLcode code;

public:
	CurlError(CURLcode _code, const char *msg)
		:CastException(GetCurlErrorCategory(_code), msg), code(_code) {}

	explicit CurlError(CURLcode _code)
		:CurlError(_code, curl_easy_strerror(_code)) {}

	CURLcode GetCode() const noexcept {
		return code;
	}
};
