// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "SoapTransportExecutor.hxx"
#include "error/CastError.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "net/HttpClient.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

static constexpr Domain soap_domain("soap");

SoapTransportExecutor::SoapTransportExecutor(HttpClient &_http,
					     std::string _control_url,
					     std::string _service_type) noexcept
	:http(_http),
	 control_url(std::move(_control_url)),
	 service_type(std::move(_service_type))
{
}

SoapTransportExecutor::~SoapTransportExecutor() noexcept = default;

SoapValues
SoapTransportExecutor::Invoke(std::string_view action, const char *instance_id,
			      const SoapArguments &args)
{
	const auto body = FormatSoapRequest(service_type, action,
					    instance_id, args);
	const HttpHeaders headers{
		{"Content-Type", "text/xml; charset=\"utf-8\""},
		{"SOAPAction", FormatSoapAction(service_type, action)},
		{"Connection", "keep-alive"},
	};

	const std::scoped_lock protect{mutex};

	FmtDebug(soap_domain, "{} -> {}", action, control_url);

	HttpResponse response;
	try {
		if (!session)
			session = http.OpenSession();

		response = session->Post(control_url, headers, body);
	} catch (...) {
		/* the connection may be in an undefined state; don't
		   reuse it */
		session.reset();
		std::throw_with_nested(FmtRuntimeError("Failed to send {} to {}",
						       action, control_url));
	}

	SoapResponse parsed;
	try {
		parsed = ParseSoapResponse(response.body);
	} catch (...) {
		if (!response.IsSuccess())
			throw CastException(ErrorCategory::COMMUNICATION,
					    fmt::format("{} failed with HTTP status {}",
							action, response.status));

		std::throw_with_nested(CastException(ErrorCategory::PARSING,
						     fmt::format("Malformed {} response",
								 action)));
	}

	if (parsed.fault)
		throw CastException(ErrorCategory::CONTROL,
				    fmt::format("{} failed: {}", action,
						parsed.fault->ToString()));

	if (!response.IsSuccess())
		throw CastException(ErrorCategory::COMMUNICATION,
				    fmt::format("{} failed with HTTP status {}",
						action, response.status));

	return std::move(parsed.values);
}

CastResult<SoapValues>
SoapTransportExecutor::ExecuteSoapAction(std::string_view action,
					 const char *instance_id,
					 const SoapArguments &args) noexcept
try {
	return Invoke(action, instance_id, args);
} catch (...) {
	auto error = MakeCastError(std::current_exception());
	FmtDebug(soap_domain, "{}: {}", action, error.message);
	return error;
}

void
SoapTransportExecutor::Release() noexcept
{
	const std::scoped_lock protect{mutex};
	session.reset();
}
