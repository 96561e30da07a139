// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "control/TransportState.hxx"

#include <gtest/gtest.h>

#include <array>

using S = TransportState;

static constexpr std::array all_states{
	S::IDLE, S::CONNECTING, S::CONNECTED, S::BUFFERING, S::PLAYING,
	S::PAUSED, S::STOPPED, S::TRANSITIONING, S::COMPLETED, S::ERROR,
};

TEST(TransportState, ToString)
{
	EXPECT_EQ(ToString(S::IDLE), "IDLE");
	EXPECT_EQ(ToString(S::PAUSED), "PAUSED");
	EXPECT_EQ(ToString(S::TRANSITIONING), "TRANSITIONING");
	EXPECT_EQ(ToString(S::ERROR), "ERROR");
}

TEST(TransportState, ParseUpnp)
{
	EXPECT_EQ(ParseUpnpTransportState("PLAYING"), S::PLAYING);
	EXPECT_EQ(ParseUpnpTransportState("PAUSED_PLAYBACK"), S::PAUSED);
	EXPECT_EQ(ParseUpnpTransportState("STOPPED"), S::STOPPED);
	EXPECT_EQ(ParseUpnpTransportState("TRANSITIONING"), S::TRANSITIONING);
	EXPECT_EQ(ParseUpnpTransportState("NO_MEDIA_PRESENT"), S::IDLE);
	EXPECT_EQ(ParseUpnpTransportState("playing"), S::IDLE);
	EXPECT_EQ(ParseUpnpTransportState(""), S::IDLE);
}

TEST(TransportState, ToUpnp)
{
	EXPECT_EQ(ToUpnpTransportState(S::PLAYING), "PLAYING");
	EXPECT_EQ(ToUpnpTransportState(S::PAUSED), "PAUSED_PLAYBACK");
	EXPECT_EQ(ToUpnpTransportState(S::IDLE), "NO_MEDIA_PRESENT");
	EXPECT_EQ(ToUpnpTransportState(S::CONNECTED), "STOPPED");
	EXPECT_EQ(ToUpnpTransportState(S::ERROR), "STOPPED");

	for (const auto s : {S::PLAYING, S::PAUSED, S::STOPPED, S::TRANSITIONING})
		EXPECT_EQ(ParseUpnpTransportState(ToUpnpTransportState(s)), s);
}

TEST(TransportState, SameStateIsAllowed)
{
	for (const auto s : all_states)
		EXPECT_TRUE(IsValidTransition(s, s)) << ToString(s);
}

TEST(TransportState, FreshStart)
{
	for (const auto to : all_states) {
		EXPECT_TRUE(IsValidTransition(S::IDLE, to)) << ToString(to);
		EXPECT_TRUE(IsValidTransition(S::ERROR, to)) << ToString(to);
	}
}

TEST(TransportState, ErrorIsAlwaysReachable)
{
	for (const auto from : all_states)
		EXPECT_TRUE(IsValidTransition(from, S::ERROR)) << ToString(from);
}

TEST(TransportState, Transitions)
{
	EXPECT_TRUE(IsValidTransition(S::CONNECTING, S::CONNECTED));
	EXPECT_FALSE(IsValidTransition(S::CONNECTING, S::PLAYING));

	EXPECT_TRUE(IsValidTransition(S::CONNECTED, S::PLAYING));
	EXPECT_FALSE(IsValidTransition(S::CONNECTED, S::PAUSED));

	EXPECT_TRUE(IsValidTransition(S::PLAYING, S::PAUSED));
	EXPECT_TRUE(IsValidTransition(S::PLAYING, S::COMPLETED));
	EXPECT_FALSE(IsValidTransition(S::PLAYING, S::CONNECTING));
	EXPECT_FALSE(IsValidTransition(S::PLAYING, S::IDLE));

	EXPECT_TRUE(IsValidTransition(S::PAUSED, S::PLAYING));
	EXPECT_TRUE(IsValidTransition(S::PAUSED, S::STOPPED));
	EXPECT_FALSE(IsValidTransition(S::PAUSED, S::TRANSITIONING));

	EXPECT_TRUE(IsValidTransition(S::STOPPED, S::PLAYING));
	EXPECT_FALSE(IsValidTransition(S::STOPPED, S::PAUSED));

	EXPECT_TRUE(IsValidTransition(S::TRANSITIONING, S::PAUSED));
	EXPECT_FALSE(IsValidTransition(S::BUFFERING, S::COMPLETED));

	EXPECT_TRUE(IsValidTransition(S::COMPLETED, S::IDLE));
	EXPECT_FALSE(IsValidTransition(S::COMPLETED, S::PAUSED));
}
