// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "DeviceFixtures.hxx"
#include "FakeHttpClient.hxx"
#include "FakeRenderer.hxx"
#include "control/ActionExecutionHandler.hxx"
#include "control/SoapTransportExecutor.hxx"
#include "control/TransportStateManager.hxx"
#include "control/PositionInfoManager.hxx"
#include "control/VolumeState.hxx"
#include "device/ServiceTypes.hxx"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace {

const std::string host = "192.168.1.10:49152";

struct ActionFixture {
	FakeHttpClient http;

	SoapTransportExecutor av_transport{http, MakeControlUrl(host, "AVTransport"),
					   std::string{av_transport_service_type}};
	std::unique_ptr<SoapTransportExecutor> rendering_control;

	TransportStateManager transport_state;
	PositionInfoManager position;
	VolumeState volume;

	std::unique_ptr<ActionExecutionHandler> handler;

	explicit ActionFixture(bool with_rendering_control=true) {
		if (with_rendering_control)
			rendering_control = std::make_unique<SoapTransportExecutor>(http,
										    MakeControlUrl(host, "RenderingControl"),
										    std::string{rendering_control_service_type});

		handler = std::make_unique<ActionExecutionHandler>(av_transport,
								   rendering_control.get(),
								   transport_state,
								   position, volume);
	}

	void Serve(const FakeRenderer &renderer) {
		http.SetHandler(renderer);
	}

	/**
	 * Serve all transport actions with empty responses.
	 */
	void ServeTransport() {
		FakeRenderer renderer;
		renderer.SetTransport();
		Serve(renderer);
	}

	std::string LastAction() const {
		const auto requests = http.GetRequests();
		if (requests.empty())
			return {};

		return std::string{GetSoapActionName(requests.back().GetHeader("SOAPAction"))};
	}
};

} // anonymous namespace

TEST(ActionExecutionHandler, SetUriAndPlay)
{
	ActionFixture f;
	f.ServeTransport();

	auto result = f.handler->Execute(MediaAction::SET_AV_TRANSPORT_URI,
					 {{"CurrentURI", "http://x/a.mp4"},
					  {"CurrentURIMetaData", "<DIDL-Lite/>"}});
	EXPECT_EQ(result, (ActionResult{{"Result", "OK"}}));
	EXPECT_EQ(f.transport_state.GetState(), TransportState::CONNECTED);
	EXPECT_EQ(f.position.GetPositionInfo().track_uri, "http://x/a.mp4");

	const auto request = f.http.GetRequests().back();
	EXPECT_NE(request.body.find("<CurrentURI>http://x/a.mp4</CurrentURI>"),
		  std::string::npos);
	EXPECT_NE(request.body.find("<CurrentURIMetaData>&lt;DIDL-Lite/&gt;</CurrentURIMetaData>"),
		  std::string::npos);

	result = f.handler->Execute("play");
	EXPECT_FALSE(ActionExecutionHandler::IsError(result));
	EXPECT_EQ(f.transport_state.GetState(), TransportState::PLAYING);
	EXPECT_EQ(f.LastAction(), "Play");
	EXPECT_NE(f.http.GetRequests().back().body.find("<Speed>1</Speed>"),
		  std::string::npos);

	result = f.handler->Execute(MediaAction::SEEK, {{"Target", "00:01:30"}});
	EXPECT_FALSE(ActionExecutionHandler::IsError(result));
	EXPECT_EQ(f.position.GetPositionInfo().rel_time, "00:01:30");

	result = f.handler->Execute(MediaAction::PAUSE);
	EXPECT_FALSE(ActionExecutionHandler::IsError(result));
	EXPECT_EQ(f.transport_state.GetState(), TransportState::PAUSED);

	result = f.handler->Execute(MediaAction::STOP);
	EXPECT_FALSE(ActionExecutionHandler::IsError(result));
	EXPECT_EQ(f.transport_state.GetState(), TransportState::STOPPED);

	/* stopping rewinds, but keeps the media */
	const auto info = f.position.GetPositionInfo();
	EXPECT_EQ(info.rel_time, "00:00:00");
	EXPECT_EQ(info.track_uri, "http://x/a.mp4");
}

TEST(ActionExecutionHandler, SetUriFailure)
{
	ActionFixture f;
	f.http.Fail(ErrorCategory::CONNECTION, "connection refused");

	const auto result = f.handler->Execute(MediaAction::SET_AV_TRANSPORT_URI,
					       {{"CurrentURI", "http://x/a.mp4"}});
	EXPECT_TRUE(ActionExecutionHandler::IsError(result));
	EXPECT_EQ(result.at("ErrorCategory"), "CONNECTION");
	EXPECT_EQ(result.at("ErrorCode"), "2001");
	EXPECT_EQ(f.transport_state.GetState(), TransportState::ERROR);
	EXPECT_TRUE(f.position.GetPositionInfo().track_uri.empty());
}

TEST(ActionExecutionHandler, SetUriMissing)
{
	ActionFixture f;
	f.ServeTransport();

	const auto result = f.handler->Execute(MediaAction::SET_AV_TRANSPORT_URI,
					       {{"CurrentURI", ""}});
	EXPECT_EQ(result.at("ErrorCategory"), "INVALID_PARAMETER");
	EXPECT_EQ(result.at("ErrorCode"), "4001");
	EXPECT_EQ(f.http.GetRequestCount(), 0u);
	EXPECT_EQ(f.transport_state.GetState(), TransportState::IDLE);
}

TEST(ActionExecutionHandler, InvalidTransitionSendsNothing)
{
	ActionFixture f;
	f.ServeTransport();
	f.transport_state.ForceState(TransportState::STOPPED);

	const auto result = f.handler->Execute(MediaAction::PAUSE);
	EXPECT_EQ(result.at("ErrorCategory"), "PLAYBACK");
	EXPECT_EQ(result.at("ErrorCode"), "3001");
	EXPECT_EQ(result.at("Error"), "Cannot Pause in state STOPPED");
	EXPECT_EQ(f.http.GetRequestCount(), 0u);
	EXPECT_EQ(f.transport_state.GetState(), TransportState::STOPPED);
}

TEST(ActionExecutionHandler, Fault)
{
	ActionFixture f;
	FakeRenderer renderer;
	f.Serve(renderer);

	f.transport_state.ForceState(TransportState::PLAYING);
	const auto result = f.handler->Execute(MediaAction::PAUSE);
	EXPECT_EQ(result.at("ErrorCategory"), "CONTROL");
	EXPECT_EQ(result.at("Error"),
		  "Pause failed: UPnPError (UPnP error 401: Invalid Action)");

	/* the state is not changed if the renderer refuses */
	EXPECT_EQ(f.transport_state.GetState(), TransportState::PLAYING);
}

TEST(ActionExecutionHandler, Seek)
{
	ActionFixture f;
	f.ServeTransport();
	f.transport_state.ForceState(TransportState::PLAYING);

	auto result = f.handler->Execute(MediaAction::SEEK, {{"Target", "00:01:30"}});
	EXPECT_FALSE(ActionExecutionHandler::IsError(result));

	const auto request = f.http.GetRequests().back();
	EXPECT_NE(request.body.find("<Unit>REL_TIME</Unit><Target>00:01:30</Target>"),
		  std::string::npos);
	EXPECT_EQ(f.position.GetPositionInfo().rel_time, "00:01:30");

	f.http.ClearRequests();
	result = f.handler->Execute(MediaAction::SEEK, {{"Target", "90 seconds"}});
	EXPECT_EQ(result.at("ErrorCategory"), "INVALID_PARAMETER");
	EXPECT_EQ(f.http.GetRequestCount(), 0u);
}

TEST(ActionExecutionHandler, InstanceId)
{
	ActionFixture f;
	f.ServeTransport();

	f.handler->Execute(MediaAction::SET_AV_TRANSPORT_URI,
			   {{"CurrentURI", "http://x/a.mp4"}, {"InstanceID", "2"}});
	EXPECT_EQ(f.transport_state.GetInstanceId(), "2");

	f.handler->Execute(MediaAction::PLAY);
	EXPECT_NE(f.http.GetRequests().back().body.find("<InstanceID>2</InstanceID>"),
		  std::string::npos);
}

TEST(ActionExecutionHandler, GetTransportInfo)
{
	ActionFixture f;
	FakeRenderer renderer;
	renderer.Set("GetTransportInfo", {{"CurrentTransportState", "PAUSED_PLAYBACK"},
					  {"CurrentTransportStatus", "OK"},
					  {"CurrentSpeed", "1"}});
	f.Serve(renderer);

	auto result = f.handler->Execute(MediaAction::GET_TRANSPORT_INFO);
	EXPECT_EQ(result.at("CurrentTransportState"), "PAUSED_PLAYBACK");
	EXPECT_EQ(result.at("TransportState"), "PAUSED");
	EXPECT_FALSE(result.contains("Degraded"));
	EXPECT_EQ(f.transport_state.GetState(), TransportState::PAUSED);

	/* the renderer goes away: the last known values are returned */
	f.http.Fail(ErrorCategory::NETWORK_TIMEOUT, "Timeout was reached");
	result = f.handler->Execute(MediaAction::GET_TRANSPORT_INFO);
	EXPECT_FALSE(ActionExecutionHandler::IsError(result));
	EXPECT_EQ(result.at("Degraded"), "1");
	EXPECT_EQ(result.at("CurrentTransportState"), "PAUSED_PLAYBACK");
	EXPECT_EQ(result.at("CurrentSpeed"), "1");
}

TEST(ActionExecutionHandler, GetTransportInfoDefaults)
{
	ActionFixture f;

	const auto result = f.handler->Execute(MediaAction::GET_TRANSPORT_INFO);
	EXPECT_EQ(result.at("Degraded"), "1");
	EXPECT_EQ(result.at("CurrentTransportState"), "STOPPED");
	EXPECT_EQ(result.at("CurrentTransportStatus"), "OK");
	EXPECT_EQ(result.at("CurrentSpeed"), "1");
}

TEST(ActionExecutionHandler, GetPositionInfo)
{
	ActionFixture f;
	FakeRenderer renderer;
	renderer.Set("GetPositionInfo", {{"Track", "1"},
					 {"TrackDuration", "00:42:00"},
					 {"TrackURI", "http://x/a.mp4"},
					 {"RelTime", "00:00:10"},
					 {"AbsTime", "NOT_IMPLEMENTED"}});
	f.Serve(renderer);

	auto result = f.handler->Execute("GetPositionInfo");
	EXPECT_EQ(result.at("TrackDuration"), "00:42:00");
	EXPECT_EQ(result.at("RelTime"), "00:00:10");
	EXPECT_EQ(result.at("TrackURI"), "http://x/a.mp4");
	EXPECT_FALSE(result.contains("Degraded"));

	/* a malformed response is handled like an unreachable renderer */
	f.http.Respond(200, "<s:Envelope>");
	result = f.handler->Execute("GetPositionInfo");
	EXPECT_EQ(result.at("Degraded"), "1");
	EXPECT_EQ(result.at("RelTime"), "00:00:10");
	EXPECT_EQ(result.at("Track"), "1");
}

TEST(ActionExecutionHandler, GetPositionInfoAfterRendererRestart)
{
	ActionFixture f;
	FakeRenderer renderer;
	renderer.SetTransport();
	renderer.Set("GetPositionInfo", {{"Track", "1"},
					 {"TrackDuration", "00:42:00"},
					 {"RelTime", "00:00:00"}});
	f.Serve(renderer);

	auto result = f.handler->Execute(MediaAction::SEEK, {{"Target", "00:01:30"}});
	ASSERT_FALSE(ActionExecutionHandler::IsError(result));

	result = f.handler->Execute("GetPositionInfo");
	EXPECT_EQ(result.at("RelTime"), "00:00:00");
	EXPECT_EQ(result.at("TrackDuration"), "00:42:00");
	EXPECT_FALSE(result.contains("Degraded"));
}

TEST(ActionExecutionHandler, Volume)
{
	ActionFixture f;
	FakeRenderer renderer;
	renderer.Set("GetVolume", {{"CurrentVolume", "35"}});
	renderer.Set("SetVolume");
	renderer.Set("GetMute", {{"CurrentMute", "0"}});
	renderer.Set("SetMute");
	f.Serve(renderer);

	auto result = f.handler->Execute(MediaAction::GET_VOLUME);
	EXPECT_EQ(result.at("CurrentVolume"), "35");
	EXPECT_EQ(f.volume.GetFreshVolume().value_or(0), 35u);

	auto request = f.http.GetRequests().back();
	EXPECT_EQ(request.url, MakeControlUrl(host, "RenderingControl"));
	EXPECT_NE(request.body.find("<Channel>Master</Channel>"), std::string::npos);

	result = f.handler->Execute(MediaAction::SET_VOLUME, {{"DesiredVolume", "80"}});
	EXPECT_EQ(result, (ActionResult{{"Result", "OK"}}));
	EXPECT_EQ(f.volume.GetFreshVolume().value_or(0), 80u);
	request = f.http.GetRequests().back();
	EXPECT_NE(request.body.find("<DesiredVolume>80</DesiredVolume>"),
		  std::string::npos);

	result = f.handler->Execute(MediaAction::GET_MUTE);
	EXPECT_EQ(result.at("CurrentMute"), "0");
	EXPECT_FALSE(f.volume.GetFreshMuted().value_or(true));

	result = f.handler->Execute(MediaAction::SET_MUTE, {{"DesiredMute", "yes"}});
	EXPECT_FALSE(ActionExecutionHandler::IsError(result));
	EXPECT_TRUE(f.volume.GetFreshMuted().value_or(false));
	EXPECT_NE(f.http.GetRequests().back().body.find("<DesiredMute>1</DesiredMute>"),
		  std::string::npos);
}

TEST(ActionExecutionHandler, VolumeValidation)
{
	ActionFixture f;
	FakeRenderer renderer;
	renderer.Set("SetVolume");
	renderer.Set("SetMute");
	f.Serve(renderer);

	for (const char *value : {"101", "-1", "loud", "", "4294967346"}) {
		const auto result = f.handler->Execute(MediaAction::SET_VOLUME,
						       {{"DesiredVolume", value}});
		EXPECT_EQ(result.at("ErrorCategory"), "INVALID_PARAMETER") << value;
	}

	auto result = f.handler->Execute(MediaAction::SET_VOLUME);
	EXPECT_EQ(result.at("ErrorCategory"), "INVALID_PARAMETER");

	result = f.handler->Execute(MediaAction::SET_MUTE, {{"DesiredMute", "maybe"}});
	EXPECT_EQ(result.at("ErrorCategory"), "INVALID_PARAMETER");

	EXPECT_EQ(f.http.GetRequestCount(), 0u);
	EXPECT_FALSE(f.volume.Get().volume);
}

TEST(ActionExecutionHandler, NoRenderingControl)
{
	ActionFixture f(false);
	f.ServeTransport();

	for (const auto action : {MediaAction::GET_VOLUME, MediaAction::SET_VOLUME,
				  MediaAction::GET_MUTE, MediaAction::SET_MUTE}) {
		const auto result = f.handler->Execute(action, {{"DesiredVolume", "10"},
								{"DesiredMute", "1"}});
		EXPECT_EQ(result.at("ErrorCategory"), "COMPATIBILITY")
			<< GetActionName(action);
		EXPECT_EQ(result.at("ErrorCode"), "6001");
	}

	EXPECT_EQ(f.http.GetRequestCount(), 0u);
}

TEST(ActionExecutionHandler, UnknownAction)
{
	ActionFixture f;

	const auto result = f.handler->Execute("Record");
	EXPECT_EQ(result, (ActionResult{{"Error", "unknown action"}}));
	EXPECT_EQ(f.http.GetRequestCount(), 0u);
}

TEST(MediaAction, Names)
{
	EXPECT_EQ(GetActionName(MediaAction::SET_AV_TRANSPORT_URI), "SetAVTransportURI");
	EXPECT_EQ(GetActionName(MediaAction::GET_MUTE), "GetMute");

	EXPECT_EQ(ParseMediaAction("SetAVTransportURI"), MediaAction::SET_AV_TRANSPORT_URI);
	EXPECT_EQ(ParseMediaAction("set_av_transport_uri"), MediaAction::SET_AV_TRANSPORT_URI);
	EXPECT_EQ(ParseMediaAction("PAUSE"), MediaAction::PAUSE);
	EXPECT_EQ(ParseMediaAction("getvolume"), MediaAction::GET_VOLUME);
	EXPECT_FALSE(ParseMediaAction("Record"));
	EXPECT_FALSE(ParseMediaAction(""));

	EXPECT_TRUE(IsRenderingControlAction(MediaAction::SET_MUTE));
	EXPECT_FALSE(IsRenderingControlAction(MediaAction::SEEK));
}
