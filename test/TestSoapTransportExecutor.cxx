// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "DeviceFixtures.hxx"
#include "FakeHttpClient.hxx"
#include "control/SoapTransportExecutor.hxx"
#include "device/ServiceTypes.hxx"
#include "error/CastError.hxx"

#include <gtest/gtest.h>

#include <string>

static const std::string control_url = MakeControlUrl("192.168.1.10:49152",
						      "AVTransport");

TEST(SoapTransportExecutor, Request)
{
	FakeHttpClient http;
	http.Respond(200, MakeSoapResponse(av_transport_service_type,
					   "GetTransportInfo",
					   {{"CurrentTransportState", "STOPPED"}}));

	SoapTransportExecutor executor(http, control_url,
				       std::string{av_transport_service_type});
	EXPECT_EQ(executor.GetControlUrl(), control_url);

	const auto values = executor.Invoke("GetTransportInfo", "0");
	EXPECT_EQ(values.at("CurrentTransportState"), "STOPPED");

	const auto requests = http.GetRequests();
	ASSERT_EQ(requests.size(), 1u);

	const auto &request = requests.front();
	EXPECT_EQ(request.method, "POST");
	EXPECT_EQ(request.url, control_url);
	EXPECT_EQ(request.GetHeader("Content-Type"), "text/xml; charset=\"utf-8\"");
	EXPECT_EQ(request.GetHeader("SOAPAction"),
		  "\"urn:schemas-upnp-org:service:AVTransport:1#GetTransportInfo\"");
	EXPECT_EQ(request.GetHeader("Connection"), "keep-alive");
	EXPECT_NE(request.body.find("<InstanceID>0</InstanceID>"),
		  request.body.npos);
}

TEST(SoapTransportExecutor, SessionReuse)
{
	FakeHttpClient http;
	http.Respond(200, MakeSoapResponse(av_transport_service_type, "Play"));

	SoapTransportExecutor executor(http, control_url,
				       std::string{av_transport_service_type});

	executor.Invoke("Play", "0", {{"Speed", "1"}});
	executor.Invoke("Play", "0", {{"Speed", "1"}});
	EXPECT_EQ(http.GetSessionCount(), 1u);

	executor.Release();
	executor.Release();
	executor.Invoke("Play", "0", {{"Speed", "1"}});
	EXPECT_EQ(http.GetSessionCount(), 2u);
	EXPECT_EQ(http.GetRequestCount(), 3u);
}

TEST(SoapTransportExecutor, Fault)
{
	FakeHttpClient http;
	http.Respond(500, MakeSoapFault(701, "Transition not available"));

	SoapTransportExecutor executor(http, control_url,
				       std::string{av_transport_service_type});

	const auto result = executor.ExecuteSoapAction("Pause", "0");
	ASSERT_FALSE(result);
	EXPECT_EQ(result.GetError().category, ErrorCategory::CONTROL);
	EXPECT_EQ(result.GetError().GetCode(), 3002u);
	EXPECT_EQ(result.GetError().message,
		  "Pause failed: UPnPError (UPnP error 701: Transition not available)");
}

TEST(SoapTransportExecutor, HttpError)
{
	FakeHttpClient http;
	http.Respond(404, "<html><body>Not Found</body></html>");

	SoapTransportExecutor executor(http, control_url,
				       std::string{av_transport_service_type});

	auto result = executor.ExecuteSoapAction("Stop", "0");
	ASSERT_FALSE(result);
	EXPECT_EQ(result.GetError().category, ErrorCategory::COMMUNICATION);
	EXPECT_EQ(result.GetError().message, "Stop failed with HTTP status 404");

	/* an error status with an empty body */
	http.Respond(503, {});
	result = executor.ExecuteSoapAction("Stop", "0");
	ASSERT_FALSE(result);
	EXPECT_EQ(result.GetError().category, ErrorCategory::COMMUNICATION);
}

TEST(SoapTransportExecutor, MalformedResponse)
{
	FakeHttpClient http;
	http.Respond(200, "<s:Envelope><s:Body>");

	SoapTransportExecutor executor(http, control_url,
				       std::string{av_transport_service_type});

	const auto result = executor.ExecuteSoapAction("GetPositionInfo", "0");
	ASSERT_FALSE(result);
	EXPECT_EQ(result.GetError().category, ErrorCategory::PARSING);
	EXPECT_EQ(result.GetError().message.rfind("Malformed GetPositionInfo response", 0),
		  0u);

	EXPECT_THROW(executor.Invoke("GetPositionInfo", "0"), CastException);
}

TEST(SoapTransportExecutor, TransportError)
{
	FakeHttpClient http;
	http.Fail(ErrorCategory::NETWORK_TIMEOUT, "Timeout was reached");

	SoapTransportExecutor executor(http, control_url,
				       std::string{av_transport_service_type});

	auto result = executor.ExecuteSoapAction("Play", "0");
	ASSERT_FALSE(result);
	EXPECT_EQ(result.GetError().category, ErrorCategory::NETWORK_TIMEOUT);
	EXPECT_NE(result.GetError().message.find("Failed to send Play to " + control_url),
		  std::string::npos);
	EXPECT_NE(result.GetError().message.find("Timeout was reached"),
		  std::string::npos);

	/* the broken session is not reused */
	http.Respond(200, MakeSoapResponse(av_transport_service_type, "Play"));
	result = executor.ExecuteSoapAction("Play", "0");
	EXPECT_TRUE(result);
	EXPECT_EQ(http.GetSessionCount(), 2u);
}

TEST(SoapTransportExecutor, ConnectionRefused)
{
	FakeHttpClient http;

	SoapTransportExecutor executor(http, control_url,
				       std::string{rendering_control_service_type});

	try {
		executor.Invoke("GetVolume", "0", {{"Channel", "Master"}});
		FAIL();
	} catch (...) {
		const auto error = MakeCastError(std::current_exception());
		EXPECT_EQ(error.category, ErrorCategory::CONNECTION);
	}
}
