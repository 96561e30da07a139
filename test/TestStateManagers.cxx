// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "control/TransportStateManager.hxx"
#include "control/PositionInfoManager.hxx"
#include "control/VolumeState.hxx"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace {

struct RecordingTransportListener final : TransportStateListener {
	std::vector<std::pair<TransportState, TransportState>> changes;

	void OnTransportStateChanged(TransportState old_state,
				     TransportState new_state) noexcept override {
		changes.emplace_back(old_state, new_state);
	}
};

struct RecordingPositionListener final : PositionListener {
	std::vector<std::pair<std::string, std::string>> changes;

	void OnPositionChanged(const std::string &position,
			       const std::string &duration) noexcept override {
		changes.emplace_back(position, duration);
	}
};

} // anonymous namespace

TEST(TransportStateManager, InitialState)
{
	TransportStateManager tsm;
	EXPECT_EQ(tsm.GetState(), TransportState::IDLE);
	EXPECT_EQ(tsm.GetInstanceId(), "0");

	const auto info = tsm.GetTransportInfo();
	EXPECT_EQ(info.state, "STOPPED");
	EXPECT_EQ(info.status, "OK");
	EXPECT_EQ(info.speed, "1");
}

TEST(TransportStateManager, Transition)
{
	RecordingTransportListener listener;
	TransportStateManager tsm;
	tsm.SetListener(&listener);

	EXPECT_TRUE(tsm.Transition(TransportState::CONNECTING));
	EXPECT_FALSE(tsm.Transition(TransportState::PLAYING));
	EXPECT_EQ(tsm.GetState(), TransportState::CONNECTING);

	EXPECT_TRUE(tsm.Transition(TransportState::CONNECTED));
	EXPECT_TRUE(tsm.CanTransition(TransportState::PLAYING));
	EXPECT_FALSE(tsm.CanTransition(TransportState::PAUSED));

	/* staying in the same state is not reported */
	EXPECT_TRUE(tsm.Transition(TransportState::CONNECTED));

	tsm.ForceState(TransportState::PAUSED);
	EXPECT_EQ(tsm.GetState(), TransportState::PAUSED);

	ASSERT_EQ(listener.changes.size(), 3u);
	EXPECT_EQ(listener.changes[0],
		  std::make_pair(TransportState::IDLE, TransportState::CONNECTING));
	EXPECT_EQ(listener.changes[1],
		  std::make_pair(TransportState::CONNECTING, TransportState::CONNECTED));
	EXPECT_EQ(listener.changes[2],
		  std::make_pair(TransportState::CONNECTED, TransportState::PAUSED));
}

TEST(TransportStateManager, ReconcileIsAuthoritative)
{
	TransportStateManager tsm;
	tsm.ForceState(TransportState::CONNECTING);

	/* not a valid transition, but the renderer knows better */
	auto info = tsm.Reconcile({{"CurrentTransportState", "PAUSED_PLAYBACK"},
				   {"CurrentTransportStatus", "OK"},
				   {"CurrentSpeed", "1"}});
	EXPECT_EQ(info.state, "PAUSED_PLAYBACK");
	EXPECT_EQ(tsm.GetState(), TransportState::PAUSED);

	/* missing and empty values keep the old ones */
	info = tsm.Reconcile({{"CurrentTransportStatus", "ERROR_OCCURRED"},
			      {"CurrentSpeed", ""}});
	EXPECT_EQ(info.state, "PAUSED_PLAYBACK");
	EXPECT_EQ(info.status, "ERROR_OCCURRED");
	EXPECT_EQ(info.speed, "1");
	EXPECT_EQ(tsm.GetState(), TransportState::PAUSED);
	EXPECT_EQ(tsm.GetTransportInfo().status, "ERROR_OCCURRED");
}

TEST(TransportStateManager, Reset)
{
	RecordingTransportListener listener;
	TransportStateManager tsm;
	tsm.SetListener(&listener);

	tsm.SetInstanceId("3");
	tsm.Reconcile({{"CurrentTransportState", "PLAYING"}});
	EXPECT_EQ(tsm.GetInstanceId(), "3");

	tsm.Reset();
	EXPECT_EQ(tsm.GetState(), TransportState::IDLE);
	EXPECT_EQ(tsm.GetInstanceId(), "0");
	EXPECT_EQ(tsm.GetTransportInfo().state, "STOPPED");

	ASSERT_EQ(listener.changes.size(), 2u);
	EXPECT_EQ(listener.changes[1],
		  std::make_pair(TransportState::PLAYING, TransportState::IDLE));
}

TEST(PositionInfoManager, Defaults)
{
	PositionInfoManager pim;
	const auto info = pim.GetPositionInfo();
	EXPECT_EQ(info.track, 1u);
	EXPECT_EQ(info.track_duration, "00:00:00");
	EXPECT_EQ(info.rel_time, "00:00:00");
	EXPECT_EQ(info.abs_time, "NOT_IMPLEMENTED");
	EXPECT_TRUE(info.track_uri.empty());
}

TEST(PositionInfoManager, Updates)
{
	RecordingPositionListener listener;
	PositionInfoManager pim;
	pim.SetListener(&listener);

	pim.UpdateMediaInfo("<DIDL-Lite/>", "http://x/a.mp4");
	pim.UpdateDuration("01:30:00");
	pim.UpdatePosition("00:10:00");

	auto info = pim.GetPositionInfo();
	EXPECT_EQ(info.track_uri, "http://x/a.mp4");
	EXPECT_EQ(info.track_metadata, "<DIDL-Lite/>");
	EXPECT_EQ(info.track_duration, "01:30:00");
	EXPECT_EQ(info.rel_time, "00:10:00");

	ASSERT_EQ(listener.changes.size(), 3u);
	EXPECT_EQ(listener.changes.back(),
		  std::make_pair(std::string{"00:10:00"}, std::string{"01:30:00"}));

	/* new media resets the position, but not the media */
	pim.UpdateMediaInfo({}, "http://x/b.mp4");
	info = pim.GetPositionInfo();
	EXPECT_EQ(info.track_uri, "http://x/b.mp4");
	EXPECT_EQ(info.rel_time, "00:00:00");
	EXPECT_EQ(info.track_duration, "00:00:00");

	pim.UpdatePosition("00:00:05");
	pim.Reset();
	info = pim.GetPositionInfo();
	EXPECT_EQ(info.rel_time, "00:00:00");
	EXPECT_EQ(info.track_uri, "http://x/b.mp4");
}

TEST(PositionInfoManager, Reconcile)
{
	PositionInfoManager pim;
	pim.UpdateMediaInfo("meta", "http://x/a.mp4");

	auto info = pim.Reconcile({{"Track", "2"},
				   {"TrackDuration", "00:42:00"},
				   {"TrackMetaData", "NOT_IMPLEMENTED"},
				   {"TrackURI", ""},
				   {"RelTime", "00:01:00"},
				   {"AbsTime", "00:01:00"},
				   {"RelCount", "2147483647"},
				   {"AbsCount", "garbage"}});
	EXPECT_EQ(info.track, 2u);
	EXPECT_EQ(info.track_duration, "00:42:00");
	EXPECT_EQ(info.track_metadata, "meta");
	EXPECT_EQ(info.track_uri, "http://x/a.mp4");
	EXPECT_EQ(info.rel_time, "00:01:00");
	EXPECT_EQ(info.abs_time, "00:01:00");
	EXPECT_EQ(info.rel_count, 2147483647);
	EXPECT_EQ(info.abs_count, 0);

	/* placeholders are reported, but don't replace known values */
	info = pim.Reconcile({{"TrackDuration", "NOT_IMPLEMENTED"},
			      {"RelTime", "0:00:00"},
			      {"Track", "-1"}});
	EXPECT_EQ(info.track_duration, "NOT_IMPLEMENTED");
	EXPECT_EQ(info.rel_time, "0:00:00");
	EXPECT_EQ(info.track, 2u);
	EXPECT_EQ(pim.GetPositionInfo().track_duration, "00:42:00");
	EXPECT_EQ(pim.GetPositionInfo().rel_time, "00:01:00");

	/* empty values are treated as missing */
	info = pim.Reconcile({{"TrackDuration", "00:00:00"},
			      {"RelTime", ""}});
	EXPECT_EQ(info.track_duration, "00:00:00");
	EXPECT_EQ(info.rel_time, "00:01:00");

	EXPECT_EQ(pim.GetPositionInfo().rel_time, "00:01:00");
	EXPECT_EQ(pim.GetPositionInfo().track_duration, "00:42:00");
}

TEST(PositionInfoManager, ReconcileReportsRestartedPosition)
{
	RecordingPositionListener listener;
	PositionInfoManager pim;
	pim.SetListener(&listener);

	pim.UpdatePosition("00:01:30");

	/* the renderer went back to the start */
	const auto info = pim.Reconcile({{"RelTime", "00:00:00"},
					 {"TrackDuration", "00:10:00"}});
	EXPECT_EQ(info.rel_time, "00:00:00");
	EXPECT_EQ(info.track_duration, "00:10:00");

	EXPECT_EQ(pim.GetPositionInfo().rel_time, "00:01:30");
	EXPECT_EQ(pim.GetPositionInfo().track_duration, "00:10:00");
	ASSERT_FALSE(listener.changes.empty());
	EXPECT_EQ(listener.changes.back(),
		  std::make_pair(std::string{"00:01:30"}, std::string{"00:10:00"}));
}

TEST(VolumeState, Freshness)
{
	using namespace std::chrono_literals;

	const auto t0 = VolumeState::Clock::now();

	VolumeState vol;
	EXPECT_FALSE(vol.GetFreshVolume(10s, t0));
	EXPECT_FALSE(vol.GetFreshMuted(10s, t0));

	vol.SetVolume(30, t0);
	vol.SetMuted(true, t0 + 5s);

	EXPECT_EQ(vol.GetFreshVolume(10s, t0 + 10s).value_or(0), 30u);
	EXPECT_FALSE(vol.GetFreshVolume(10s, t0 + 11s));
	EXPECT_TRUE(vol.GetFreshMuted(10s, t0 + 11s).value_or(false));
	EXPECT_FALSE(vol.GetFreshMuted(10s, t0 + 16s));

	/* stale values are still available */
	const auto snapshot = vol.Get();
	EXPECT_EQ(snapshot.volume.value_or(0), 30u);
	EXPECT_TRUE(snapshot.muted.value_or(false));

	vol.Clear();
	EXPECT_FALSE(vol.Get().volume);
	EXPECT_FALSE(vol.Get().muted);
}
