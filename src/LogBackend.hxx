// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "LogLevel.hxx"

void
SetLogThreshold(LogLevel _threshold) noexcept;

[[gnu::pure]]
LogLevel
GetLogThreshold() noexcept;

void
EnableLogTimestamp() noexcept;
