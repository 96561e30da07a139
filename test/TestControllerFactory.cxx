// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "DeviceFixtures.hxx"
#include "FakeHttpClient.hxx"
#include "FakeRenderer.hxx"
#include "config/CastConfig.hxx"
#include "control/Controller.hxx"
#include "control/ControllerFactory.hxx"
#include "device/DeviceCache.hxx"
#include "device/DeviceRegistry.hxx"
#include "error/CastError.hxx"
#include "thread/WorkQueue.hxx"

#include <gtest/gtest.h>

#include <future>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

struct FactoryFixture : ::testing::Test {
	const CastConfig config;

	WorkQueue queue{"test", 4};
	DeviceCache cache{100, 10s};
	DeviceRegistry registry{cache};

	FakeHttpClient http;

	ControllerFactory factory{registry, http, queue, config};

	FactoryFixture() noexcept {
		FakeRenderer renderer;
		renderer.SetTransport();
		renderer.Set("GetVolume", {{"CurrentVolume", "20"}});
		renderer.Set("GetMute", {{"CurrentMute", "1"}});
		http.SetHandler(renderer);
	}

	DevicePtr AddRenderer(std::string udn, std::string_view name,
			      std::string_view host="192.168.1.10:49152") noexcept {
		auto device = MakeRenderer(std::move(udn), name, host);
		registry.AddDevice(device);
		return device;
	}
};

} // anonymous namespace

TEST_F(FactoryFixture, OneControllerPerDevice)
{
	const auto device = AddRenderer("uuid:a", "Living Room");

	constexpr unsigned n_threads = 8;
	std::vector<std::shared_ptr<Controller>> results(n_threads);
	std::vector<std::thread> threads;

	for (unsigned i = 0; i < n_threads; ++i)
		threads.emplace_back([this, &device, &result=results[i]]{
			result = factory.GetController(device);
		});

	for (auto &t : threads)
		t.join();

	for (const auto &c : results)
		EXPECT_EQ(c, results.front());

	EXPECT_EQ(factory.GetControllerCount(), 1u);
	EXPECT_EQ(factory.FindController("uuid:a"), results.front());
	EXPECT_EQ(results.front()->GetUdn(), "uuid:a");
	EXPECT_EQ(results.front()->GetControlUrl(),
		  MakeControlUrl("192.168.1.10:49152", "AVTransport"));
}

TEST_F(FactoryFixture, SeveralDevices)
{
	const auto a = AddRenderer("uuid:a", "Living Room");
	const auto b = AddRenderer("uuid:b", "Kitchen", "192.168.1.11:49152");

	const auto ca = factory.GetController(a);
	const auto cb = factory.GetController(b);
	EXPECT_NE(ca, cb);
	EXPECT_EQ(factory.GetControllerCount(), 2u);

	EXPECT_EQ(factory.GetDeviceByUSN("uuid:b"), b);
	EXPECT_FALSE(factory.GetDeviceByUSN("uuid:c"));
	EXPECT_FALSE(factory.FindController("uuid:c"));
}

TEST_F(FactoryFixture, NoAVTransport)
{
	auto device = std::make_shared<Device>("uuid:nas");
	device->friendly_name = "NAS";

	try {
		factory.GetController(device);
		FAIL();
	} catch (const CastException &e) {
		EXPECT_EQ(e.GetCategory(), ErrorCategory::DEVICE);
	}

	EXPECT_EQ(factory.GetControllerCount(), 0u);
}

TEST_F(FactoryFixture, ControlUrlChange)
{
	const auto device = AddRenderer("uuid:a", "Living Room");
	const auto old_controller = factory.GetController(device);

	/* the renderer comes back with a new address */
	const auto moved = AddRenderer("uuid:a", "Living Room", "192.168.1.20:49152");

	EXPECT_TRUE(old_controller->IsCancelled());
	EXPECT_FALSE(factory.FindController("uuid:a"));

	const auto new_controller = factory.GetController(moved);
	EXPECT_NE(new_controller, old_controller);
	EXPECT_EQ(new_controller->GetControlUrl(),
		  MakeControlUrl("192.168.1.20:49152", "AVTransport"));

	/* an unchanged update keeps the controller */
	AddRenderer("uuid:a", "Living Room", "192.168.1.20:49152");
	EXPECT_EQ(factory.FindController("uuid:a"), new_controller);
	EXPECT_FALSE(new_controller->IsCancelled());
}

TEST_F(FactoryFixture, StaleDeviceIsReplaced)
{
	const auto device = AddRenderer("uuid:a", "Living Room");
	const auto old_controller = factory.GetController(device);

	/* a caller with a newer copy of the device, before the
	   registry has seen it */
	const auto moved = MakeRenderer("uuid:a", "Living Room", "192.168.1.20:49152");
	const auto new_controller = factory.GetController(moved);

	EXPECT_NE(new_controller, old_controller);
	EXPECT_TRUE(old_controller->IsCancelled());
	EXPECT_EQ(factory.GetControllerCount(), 1u);
}

TEST_F(FactoryFixture, DeviceRemoved)
{
	const auto device = AddRenderer("uuid:a", "Living Room");
	const auto controller = factory.GetController(device);

	registry.RemoveDeviceById("uuid:a");

	EXPECT_TRUE(controller->IsCancelled());
	EXPECT_FALSE(controller->Submit(MediaAction::PLAY, {}, nullptr));
	EXPECT_EQ(factory.GetControllerCount(), 0u);
}

TEST_F(FactoryFixture, RemoveAndClear)
{
	const auto a = factory.GetController(AddRenderer("uuid:a", "Living Room"));
	const auto b = factory.GetController(AddRenderer("uuid:b", "Kitchen",
							 "192.168.1.11:49152"));

	EXPECT_TRUE(factory.RemoveController("uuid:a"));
	EXPECT_FALSE(factory.RemoveController("uuid:a"));
	EXPECT_TRUE(a->IsCancelled());
	EXPECT_EQ(factory.GetControllerCount(), 1u);

	factory.ClearAll();
	EXPECT_TRUE(b->IsCancelled());
	EXPECT_EQ(factory.GetControllerCount(), 0u);

	factory.ClearAll();
}

TEST_F(FactoryFixture, Cast)
{
	const auto controller = factory.GetController(AddRenderer("uuid:a", "Living Room"));

	const auto result = controller->Cast("http://x/movie.mp4", "Movie", 90s);
	EXPECT_EQ(result, (ActionResult{{"Result", "OK"}}));
	EXPECT_EQ(controller->GetTransportState(), TransportState::PLAYING);

	EXPECT_EQ(GetActionNames(http),
		  (std::vector<std::string>{"SetAVTransportURI", "Play", "Seek"}));

	const auto requests = http.GetRequests();
	EXPECT_NE(requests[0].body.find("<CurrentURI>http://x/movie.mp4</CurrentURI>"),
		  std::string::npos);
	EXPECT_NE(requests[0].body.find("&lt;dc:title&gt;Movie&lt;/dc:title&gt;"),
		  std::string::npos);
	EXPECT_NE(requests[2].body.find("<Target>00:01:30</Target>"),
		  std::string::npos);

	EXPECT_EQ(controller->GetPositionInfo().track_uri, "http://x/movie.mp4");
}

TEST_F(FactoryFixture, CastWithoutSeek)
{
	const auto controller = factory.GetController(AddRenderer("uuid:a", "Living Room"));

	controller->Cast("http://x/movie.mp4", "Movie");
	EXPECT_EQ(GetActionNames(http),
		  (std::vector<std::string>{"SetAVTransportURI", "Play"}));
}

TEST_F(FactoryFixture, CastFailure)
{
	const auto controller = factory.GetController(AddRenderer("uuid:a", "Living Room"));

	FakeRenderer renderer;
	renderer.Set("SetAVTransportURI");
	http.SetHandler(renderer);

	const auto result = controller->Cast("http://x/movie.mp4", "Movie", 10s);
	EXPECT_EQ(result.at("ErrorCategory"), "CONTROL");

	/* no "Seek" after a failed "Play" */
	EXPECT_EQ(GetActionNames(http),
		  (std::vector<std::string>{"SetAVTransportURI", "Play"}));
}

TEST_F(FactoryFixture, Submit)
{
	const auto controller = factory.GetController(AddRenderer("uuid:a", "Living Room"));

	std::promise<ActionResult> promise;
	auto future = promise.get_future();

	ASSERT_TRUE(controller->Submit(MediaAction::SET_AV_TRANSPORT_URI,
				       {{"CurrentURI", "http://x/a.mp4"}},
				       [&promise](ActionResult &&result){
					       promise.set_value(std::move(result));
				       }));

	ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
	EXPECT_EQ(future.get(), (ActionResult{{"Result", "OK"}}));
	EXPECT_EQ(controller->GetTransportState(), TransportState::CONNECTED);

	controller->Release();
	EXPECT_TRUE(controller->IsCancelled());
	EXPECT_FALSE(controller->Submit(MediaAction::PLAY, {}, nullptr));
}

TEST_F(FactoryFixture, VolumeState)
{
	const auto controller = factory.GetController(AddRenderer("uuid:a", "Living Room"));
	EXPECT_TRUE(controller->HasRenderingControl());

	auto state = controller->GetVolumeState();
	EXPECT_EQ(state.volume.value_or(0), 20u);
	EXPECT_TRUE(state.muted.value_or(false));
	EXPECT_EQ(http.GetRequestCount(), 2u);

	/* served from the cache */
	state = controller->GetVolumeState();
	EXPECT_EQ(state.volume.value_or(0), 20u);
	EXPECT_EQ(http.GetRequestCount(), 2u);

	/* too old */
	controller->GetVolumeState(0s);
	EXPECT_EQ(http.GetRequestCount(), 4u);

	EXPECT_EQ(controller->GetCachedVolumeState().volume.value_or(0), 20u);
}

TEST_F(FactoryFixture, VolumeStateWithoutRenderingControl)
{
	auto device = MakeRenderer("uuid:a", "Speaker", "192.168.1.10:49152",
				   "Acme", false);
	registry.AddDevice(device);

	const auto controller = factory.GetController(device);
	EXPECT_FALSE(controller->HasRenderingControl());

	const auto state = controller->GetVolumeState();
	EXPECT_FALSE(state.volume);
	EXPECT_FALSE(state.muted);
	EXPECT_EQ(http.GetRequestCount(), 0u);
}
