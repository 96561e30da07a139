// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

/**
 * Manages curl_global_init() and curl_global_cleanup() with a
 * reference counter.  Create one instance for as long as libcurl is
 * used.
 */
class CurlGlobalInit {
public:
	/**
	 * Throws #CurlError on error.
	 */
	CurlGlobalInit();

	~CurlGlobalInit() noexcept;

	CurlGlobalInit(const CurlGlobalInit &) = delete;
	CurlGlobalInit &operator=(const CurlGlobalInit &) = delete;
};
