// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "Callback.hxx"
#include "discovery/SsdpClient.hxx"

#include <mutex>
#include <string>

/**
 * An #SsdpClient implementation using libupnp.
 */
class UpnpSsdpClient final : public SsdpClient, UpnpCallback {
	/**
	 * The network interface; empty for the default.
	 */
	const std::string iface;

	UpnpClient_Handle handle;

	/**
	 * Protects #handler; held while the handler is being invoked.
	 */
	std::mutex mutex;

	SsdpHandler *handler = nullptr;

public:
	explicit UpnpSsdpClient(std::string _iface) noexcept
		:iface(std::move(_iface)) {}

	~UpnpSsdpClient() noexcept override {
		Close();
	}

	/* virtual methods from class SsdpClient */
	void Open(SsdpHandler &_handler) override;
	void Close() noexcept override;
	void Search(std::string_view target, std::chrono::seconds mx) override;

private:
	void Dispatch(SsdpMessage::Type type, const UpnpDiscovery &disco) noexcept;

	/* virtual methods from class UpnpCallback */
	int Invoke(Upnp_EventType et, const void *evp) noexcept override;
};
