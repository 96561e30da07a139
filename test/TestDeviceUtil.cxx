// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "device/Util.hxx"
#include "device/Device.hxx"
#include "device/ServiceTypes.hxx"

#include <gtest/gtest.h>

TEST(DeviceUtil, ConcatUrl)
{
	EXPECT_EQ(ConcatUrl("http://h/", "/x"), "http://h/x");
	EXPECT_EQ(ConcatUrl("http://h", "x"), "http://h/x");
	EXPECT_EQ(ConcatUrl("http://h/", "x"), "http://h/x");
	EXPECT_EQ(ConcatUrl("http://h", "/x"), "http://h/x");
	EXPECT_EQ(ConcatUrl("http://h", ""), "http://h");
}

TEST(DeviceUtil, ParentUrl)
{
	EXPECT_EQ(GetParentUrl("http://h:1/dev/desc.xml"), "http://h:1/dev/");
	EXPECT_EQ(GetParentUrl("http://h:1/desc.xml?x=/y"), "http://h:1/");
	EXPECT_EQ(GetParentUrl("http://h:1"), "http://h:1/");
	EXPECT_EQ(GetParentUrl("http://h:1/"), "http://h:1/");
}

TEST(DeviceUtil, ResolveUrl)
{
	EXPECT_EQ(ResolveUrl("http://h:1/dev/", "ctl"), "http://h:1/dev/ctl");
	EXPECT_EQ(ResolveUrl("http://h:1/dev/", "/ctl"), "http://h:1/ctl");
	EXPECT_EQ(ResolveUrl("http://h:1/dev/", " http://other/ctl "),
		  "http://other/ctl");
	EXPECT_EQ(ResolveUrl("http://h:1", "/ctl"), "http://h:1/ctl");
	EXPECT_EQ(ResolveUrl("http://h:1/", ""), "");
}

TEST(DeviceUtil, UrlHost)
{
	EXPECT_EQ(GetUrlHost("http://192.168.1.2:8080/desc.xml"), "192.168.1.2:8080");
	EXPECT_EQ(GetUrlHost("http://user:pw@host/x"), "host");
	EXPECT_EQ(GetUrlHost("http://host?q"), "host");
	EXPECT_EQ(GetUrlHost("/desc.xml"), "");
	EXPECT_EQ(GetUrlHost(""), "");
}

TEST(DeviceUtil, UrlExtension)
{
	EXPECT_EQ(GetUrlExtension("http://h/a/movie.MKV"), "mkv");
	EXPECT_EQ(GetUrlExtension("http://h/live.m3u8?token=a.b"), "m3u8");
	EXPECT_EQ(GetUrlExtension("http://h/a.dir/file"), "");
	EXPECT_EQ(GetUrlExtension("http://h/x.mp3#t=10"), "mp3");
}

TEST(ServiceTypes, IgnoreVersion)
{
	EXPECT_TRUE(IsSameUpnpType("urn:schemas-upnp-org:service:AVTransport:2",
				   av_transport_service_type));
	EXPECT_FALSE(IsSameUpnpType("urn:schemas-upnp-org:service:ConnectionManager:1",
				    av_transport_service_type));
	EXPECT_TRUE(IsSameUpnpType("foo", "foo"));
	EXPECT_FALSE(IsSameUpnpType("foo", "bar"));
}

TEST(Device, Services)
{
	Device device("uuid:1");
	device.location = "http://10.0.0.5:1400/xml/device_description.xml";
	device.services.push_back({"urn:schemas-upnp-org:service:AVTransport:3",
				   "id", "http://10.0.0.5:1400/av", {}, {}});

	ASSERT_NE(device.GetAVTransport(), nullptr);
	EXPECT_EQ(device.GetAVTransport()->control_url, "http://10.0.0.5:1400/av");
	EXPECT_EQ(device.GetRenderingControl(), nullptr);
	EXPECT_TRUE(device.IsMediaRenderer());
	EXPECT_EQ(device.GetAddress(), "10.0.0.5:1400");
}

TEST(Device, DisplayName)
{
	Device device("uuid:1");
	EXPECT_EQ(device.GetDisplayName(), "uuid:1");

	device.model_name = "Model";
	EXPECT_EQ(device.GetDisplayName(), "Model");

	device.friendly_name = "Living Room";
	EXPECT_EQ(device.GetDisplayName(), "Living Room");
}

TEST(Device, SameMetadata)
{
	Device a("uuid:1"), b("uuid:1");
	a.friendly_name = b.friendly_name = "TV";
	EXPECT_TRUE(a.IsSameMetadata(b));

	b.location = "http://elsewhere/";
	EXPECT_FALSE(a.IsSameMetadata(b));

	b.location = a.location;
	b.services.push_back({"t", "i", "c", "e", "s"});
	EXPECT_FALSE(a.IsSameMetadata(b));
}

TEST(DeviceUtil, NormalizeUdn)
{
	EXPECT_EQ(NormalizeUdn("uuid:5F9EC1B3-ED59-79BB-4530-745CE64CEC8D"),
		  "uuid:5f9ec1b3-ed59-79bb-4530-745ce64cec8d");
	EXPECT_EQ(NormalizeUdn(" uuid:abc\r\n"), "uuid:abc");
	EXPECT_EQ(NormalizeUdn("  "), "");
}

TEST(Device, RenameUdn)
{
	Device a("uuid:ABC");
	a.friendly_name = "TV";

	const Device b("uuid:abc", std::move(a));
	EXPECT_EQ(b.GetUdn(), "uuid:abc");
	EXPECT_EQ(b.friendly_name, "TV");
}
