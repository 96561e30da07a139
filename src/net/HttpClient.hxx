// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
	unsigned status = 0;

	std::string body;

	bool IsSuccess() const noexcept {
		return status >= 200 && status < 300;
	}
};

/**
 * A connection (or a pool of connections) which can be reused for
 * several requests, e.g. with HTTP keep-alive.  An instance is used
 * by only one thread at a time.
 */
class HttpSession {
public:
	virtual ~HttpSession() noexcept = default;

	/**
	 * Throws #CastException with category NETWORK, NETWORK_TIMEOUT
	 * or CONNECTION on transport failure.  HTTP error statuses are
	 * not errors at this level.
	 */
	virtual HttpResponse Get(const std::string &url) = 0;

	/**
	 * @see Get()
	 */
	virtual HttpResponse Post(const std::string &url,
				  const HttpHeaders &headers,
				  std::string_view body) = 0;
};

/**
 * Factory for #HttpSession instances.  Must be thread-safe.
 */
class HttpClient {
public:
	virtual ~HttpClient() noexcept = default;

	/**
	 * Throws on error.
	 */
	virtual std::unique_ptr<HttpSession> OpenSession() = 0;
};
