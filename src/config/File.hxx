// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <istream>

struct ConfigData;

/**
 * Parse configuration lines of the form `name "value"` from a
 * stream.  Empty lines and lines starting with '#' are ignored.
 *
 * Throws on error; the line number is in a nested exception.
 */
void
ReadConfigFile(ConfigData &data, std::istream &is);

/**
 * Throws on error.
 */
void
ReadConfigFile(ConfigData &data, const char *path);
