// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <upnp/upnp.h>

class UpnpCallback;

/**
 * Initialize libupnp (on the given network interface, nullptr for
 * the default) and register a control point client.  Calls are
 * reference counted; the handle is shared by all callers.
 *
 * Events without a cookie (i.e. advertisements) are delivered to
 * all #UpnpCallback instances registered here; search results go
 * to the cookie passed to UpnpSearchAsync().
 *
 * Throws on error.
 */
UpnpClient_Handle
UpnpClientGlobalInit(const char *iface, UpnpCallback &callback);

void
UpnpClientGlobalFinish(UpnpCallback &callback) noexcept;
