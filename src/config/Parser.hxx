// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <chrono>

/**
 * Parse a boolean setting ("yes"/"no", "true"/"false", "1"/"0").
 *
 * Throws on error.
 */
bool
ParseBool(const char *value);

/**
 * Throws on error.
 */
long
ParseLong(const char *s);

/**
 * Throws on error.
 */
unsigned
ParseUnsigned(const char *s);

/**
 * Same as ParseUnsigned(), but rejects zero.
 *
 * Throws on error.
 */
unsigned
ParsePositive(const char *s);

/**
 * Parse a duration.  The number is in seconds unless it has the
 * suffix "ms"; the suffix "s" is accepted, too.
 *
 * Throws on error.
 */
std::chrono::steady_clock::duration
ParseDuration(const char *s);
