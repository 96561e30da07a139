// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "ClientInit.hxx"
#include "Callback.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <upnp/upnptools.h>

#include <algorithm>
#include <mutex>
#include <vector>

static constexpr Domain upnp_domain("upnp");

static std::mutex upnp_client_init_mutex;
static unsigned upnp_client_init_ref = 0;
static UpnpClient_Handle upnp_client_handle;

/**
 * Receivers of advertisements.  Protected by
 * #upnp_client_init_mutex.
 */
static std::vector<UpnpCallback *> upnp_client_callbacks;

static int
UpnpClientCallback(Upnp_EventType et, const void *evp, void *cookie) noexcept
{
	if (cookie != nullptr)
		return UpnpCallback::FromUpnpCookie(cookie).Invoke(et, evp);

	const std::scoped_lock protect{upnp_client_init_mutex};
	for (auto *callback : upnp_client_callbacks)
		callback->Invoke(et, evp);

	return UPNP_E_SUCCESS;
}

static void
DoInit(const char *iface)
{
	if (int code = UpnpInit2(iface, 0); code != UPNP_E_SUCCESS)
		throw FmtRuntimeError("UpnpInit2() failed: {}",
				      UpnpGetErrorMessage(code));

	if (const char *address = UpnpGetServerIpAddress())
		FmtDebug(upnp_domain, "listening on {}:{}",
			 address, UpnpGetServerPort());

	if (int code = UpnpRegisterClient(UpnpClientCallback, nullptr,
					  &upnp_client_handle);
	    code != UPNP_E_SUCCESS) {
		UpnpFinish();
		throw FmtRuntimeError("UpnpRegisterClient() failed: {}",
				      UpnpGetErrorMessage(code));
	}
}

UpnpClient_Handle
UpnpClientGlobalInit(const char *iface, UpnpCallback &callback)
{
	const std::scoped_lock protect{upnp_client_init_mutex};

	if (upnp_client_init_ref == 0)
		DoInit(iface);

	++upnp_client_init_ref;
	upnp_client_callbacks.push_back(&callback);
	return upnp_client_handle;
}

void
UpnpClientGlobalFinish(UpnpCallback &callback) noexcept
{
	bool finish;

	{
		const std::scoped_lock protect{upnp_client_init_mutex};

		upnp_client_callbacks.erase(std::remove(upnp_client_callbacks.begin(),
							upnp_client_callbacks.end(),
							&callback),
					    upnp_client_callbacks.end());

		finish = --upnp_client_init_ref == 0;
	}

	if (finish) {
		/* outside the lock: UpnpFinish() waits for the callback
		   threads */
		UpnpUnRegisterClient(upnp_client_handle);
		UpnpFinish();
	}
}
