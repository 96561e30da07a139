// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <exception>

/**
 * Print this exception and its nested exceptions to stderr, one per
 * line, outermost first.
 */
void
PrintException(const std::exception_ptr &ep) noexcept;
