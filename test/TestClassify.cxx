// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "device/Classify.hxx"
#include "device/Device.hxx"

#include <gtest/gtest.h>

static Device
MakeDevice(const char *manufacturer, const char *model_name)
{
	Device device("uuid:x");
	device.manufacturer = manufacturer;
	device.model_name = model_name;
	return device;
}

TEST(Classify, Kind)
{
	EXPECT_EQ(ClassifyDevice(MakeDevice("Samsung Electronics", "UE55")), DeviceKind::TV);
	EXPECT_EQ(ClassifyDevice(MakeDevice("Xiaomi", "MiBOX")), DeviceKind::TV);
	EXPECT_EQ(ClassifyDevice(MakeDevice("Acme", "Smart TV 3000")), DeviceKind::TV);
	EXPECT_EQ(ClassifyDevice(MakeDevice("Roku", "Streaming Stick")), DeviceKind::BOX);
	EXPECT_EQ(ClassifyDevice(MakeDevice("Acme", "Media Box")), DeviceKind::BOX);
	EXPECT_EQ(ClassifyDevice(MakeDevice("Denon", "AVR-X1600H")), DeviceKind::OTHER);
	EXPECT_EQ(ClassifyDevice(MakeDevice("", "")), DeviceKind::OTHER);
}

TEST(Classify, Priority)
{
	EXPECT_GT(GetDevicePriority(DeviceKind::TV),
		  GetDevicePriority(DeviceKind::BOX));
	EXPECT_GT(GetDevicePriority(DeviceKind::BOX),
		  GetDevicePriority(DeviceKind::OTHER));
}
