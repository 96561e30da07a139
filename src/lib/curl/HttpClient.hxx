// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "Global.hxx"
#include "net/HttpClient.hxx"

#include <chrono>
#include <string>

/**
 * An #HttpClient implementation using libcurl.  Each session owns
 * one "easy" handle, which keeps its connection alive between
 * requests.
 */
class CurlHttpClient final : public HttpClient {
	CurlGlobalInit global_init;

	const std::string user_agent;

	const std::chrono::steady_clock::duration connect_timeout;
	const std::chrono::steady_clock::duration request_timeout;

public:
	/**
	 * Throws on error.
	 */
	CurlHttpClient(std::string _user_agent,
		       std::chrono::steady_clock::duration _connect_timeout,
		       std::chrono::steady_clock::duration _request_timeout);

	/* virtual methods from class HttpClient */
	std::unique_ptr<HttpSession> OpenSession() override;
};
