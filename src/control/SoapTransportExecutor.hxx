// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "SoapEnvelope.hxx"
#include "error/Result.hxx"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

class HttpClient;
class HttpSession;

/**
 * Sends UPnP actions to one service of one device.  Requests are
 * serialized: only one exchange runs at a time, and a second caller
 * waits for the first one to finish.  The HTTP connection is kept
 * alive between requests.
 */
class SoapTransportExecutor {
	HttpClient &http;

	const std::string control_url;
	const std::string service_type;

	/**
	 * Serializes exchanges; protects #session.
	 */
	std::mutex mutex;

	std::unique_ptr<HttpSession> session;

public:
	SoapTransportExecutor(HttpClient &_http,
			      std::string _control_url,
			      std::string _service_type) noexcept;

	~SoapTransportExecutor() noexcept;

	SoapTransportExecutor(const SoapTransportExecutor &) = delete;
	SoapTransportExecutor &operator=(const SoapTransportExecutor &) = delete;

	const std::string &GetControlUrl() const noexcept {
		return control_url;
	}

	const std::string &GetServiceType() const noexcept {
		return service_type;
	}

	/**
	 * Invoke an action and return its output arguments or a
	 * #CastError: CONTROL for a SOAP fault, COMMUNICATION for an
	 * HTTP error status, NETWORK/NETWORK_TIMEOUT/CONNECTION for
	 * transport failures and PARSING for malformed responses.
	 *
	 * @param instance_id the "InstanceID" argument; nullptr to
	 * omit it
	 */
	CastResult<SoapValues> ExecuteSoapAction(std::string_view action,
						 const char *instance_id,
						 const SoapArguments &args={}) noexcept;

	/**
	 * Like ExecuteSoapAction(), but throws #CastException on error.
	 */
	SoapValues Invoke(std::string_view action, const char *instance_id,
			  const SoapArguments &args={});

	/**
	 * Close the HTTP connection.  The next request opens a new one.
	 * May be called multiple times.
	 */
	void Release() noexcept;
};
