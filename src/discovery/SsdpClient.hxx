// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <chrono>
#include <string>
#include <string_view>

/**
 * A parsed SSDP packet: a search response or an unsolicited
 * advertisement.
 */
struct SsdpMessage {
	enum class Type {
		/**
		 * NOTIFY with NTS "ssdp:alive".
		 */
		ALIVE,

		/**
		 * NOTIFY with NTS "ssdp:byebye".
		 */
		BYEBYE,

		/**
		 * A (unicast) response to our M-SEARCH.
		 */
		RESPONSE,
	};

	Type type;

	/**
	 * The device's UDN, extracted from the USN header.
	 */
	std::string udn;

	/**
	 * The LOCATION header, i.e. the URL of the device description.
	 * Empty for BYEBYE.
	 */
	std::string location;

	/**
	 * The NT/ST header.
	 */
	std::string type_urn;

	/**
	 * The "max-age" from the CACHE-CONTROL header; zero if missing.
	 */
	std::chrono::seconds max_age{0};
};

/**
 * Receives SSDP messages from a #SsdpClient.  The methods may be
 * invoked from arbitrary threads, concurrently.
 */
class SsdpHandler {
public:
	virtual void OnSsdpMessage(const SsdpMessage &message) noexcept = 0;
};

/**
 * The network transport for SSDP discovery.
 */
class SsdpClient {
public:
	virtual ~SsdpClient() noexcept = default;

	/**
	 * Acquire the sockets and start delivering messages to the
	 * handler.
	 *
	 * Throws on error.
	 */
	virtual void Open(SsdpHandler &handler) = 0;

	/**
	 * Release the sockets.  After this method returns, the handler
	 * will not be invoked anymore.
	 */
	virtual void Close() noexcept = 0;

	/**
	 * Send an M-SEARCH request; responses are delivered
	 * asynchronously.
	 *
	 * Throws on error.
	 */
	virtual void Search(std::string_view target,
			    std::chrono::seconds mx) = 0;
};
