// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

struct CastError;

/**
 * Receives lifecycle events from the #Router.  Methods are invoked
 * from worker threads.
 */
class DiscoveryObserver {
public:
	virtual void OnSearchStarted() noexcept {}
	virtual void OnSearchFinished() noexcept {}

	/**
	 * A discovery problem which did not stop the discovery engine
	 * (e.g. multicast reception is not available).
	 */
	virtual void OnDiscoveryError(const CastError &error) noexcept = 0;
};
