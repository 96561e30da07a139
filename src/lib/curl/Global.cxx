// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Global.hxx"
#include "Error.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <curl/curl.h>

#include <mutex>

static constexpr Domain curl_domain("curl");

static std::mutex curl_global_mutex;
static unsigned curl_global_ref;

CurlGlobalInit::CurlGlobalInit()
{
	const std::scoped_lock protect{curl_global_mutex};

	if (curl_global_ref == 0) {
		CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
		if (code != CURLE_OK)
			throw CurlError(code, "curl_global_init() failed");

		if (const auto *info = curl_version_info(CURLVERSION_NOW))
			FmtDebug(curl_domain, "version {}", info->version);
	}

	++curl_global_ref;
}

CurlGlobalInit::~CurlGlobalInit() noexcept
{
	const std::scoped_lock protect{curl_global_mutex};

	if (--curl_global_ref == 0)
		curl_global_cleanup();
}
