// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#define UPNPCAST_VERSION "0.3.0"

#define UPNPCAST_USER_AGENT "upnpcast/" UPNPCAST_VERSION
