// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <utility>

/**
 * Invokes a function when the object is destroyed, unless
 * Cancel() was called before.
 */
template<typename F>
class ScopeExitGuard {
	F function;
	bool enabled = true;

public:
	explicit ScopeExitGuard(F &&f) noexcept
		:function(std::forward<F>(f)) {}

	ScopeExitGuard(ScopeExitGuard &&src) noexcept
		:function(std::move(src.function)), enabled(src.enabled)
	{
		src.enabled = false;
	}

	~ScopeExitGuard() noexcept {
		if (enabled)
			function();
	}

	ScopeExitGuard(const ScopeExitGuard &) = delete;
	ScopeExitGuard &operator=(const ScopeExitGuard &) = delete;

	void Cancel() noexcept {
		enabled = false;
	}
};

template<typename F>
ScopeExitGuard<F>
MakeScopeExit(F &&f) noexcept
{
	return ScopeExitGuard<F>(std::forward<F>(f));
}
