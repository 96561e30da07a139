// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "TransportState.hxx"
#include "SoapEnvelope.hxx"

#include <mutex>
#include <string>

/**
 * The result of "GetTransportInfo", as reported by the renderer.
 */
struct TransportInfo {
	std::string state = "STOPPED";
	std::string status = "OK";
	std::string speed = "1";
};

class TransportStateListener {
public:
	virtual void OnTransportStateChanged(TransportState old_state,
					     TransportState new_state) noexcept = 0;
};

/**
 * Tracks the transport state of one renderer.  Thread-safe; the
 * listener is invoked without holding the lock.
 */
class TransportStateManager {
	mutable std::mutex mutex;

	TransportState state = TransportState::IDLE;

	/**
	 * The last "GetTransportInfo" result; until there is one, the
	 * default values.
	 */
	TransportInfo info;

	std::string instance_id = "0";

	TransportStateListener *listener = nullptr;

public:
	/**
	 * Must be called before any other method.
	 */
	void SetListener(TransportStateListener *_listener) noexcept {
		listener = _listener;
	}

	[[gnu::pure]]
	TransportState GetState() const noexcept {
		const std::scoped_lock protect{mutex};
		return state;
	}

	[[gnu::pure]]
	bool CanTransition(TransportState to) const noexcept {
		return IsValidTransition(GetState(), to);
	}

	/**
	 * Switch to a new state if the transition is valid.
	 *
	 * @return false if the transition was rejected
	 */
	bool Transition(TransportState to) noexcept;

	/**
	 * Switch to a new state unconditionally.
	 */
	void ForceState(TransportState to) noexcept;

	/**
	 * Apply the output of a "GetTransportInfo" action.  The state
	 * reported by the renderer is authoritative: it is applied even
	 * if the transition is not valid, which is only logged.
	 * Missing values keep their previous value.
	 *
	 * @return the new #TransportInfo
	 */
	TransportInfo Reconcile(const SoapValues &values) noexcept;

	/**
	 * The last known #TransportInfo.
	 */
	TransportInfo GetTransportInfo() const noexcept {
		const std::scoped_lock protect{mutex};
		return info;
	}

	static TransportInfo GetDefaultTransportInfo() noexcept {
		return {};
	}

	void SetInstanceId(std::string _instance_id) noexcept {
		const std::scoped_lock protect{mutex};
		instance_id = std::move(_instance_id);
	}

	std::string GetInstanceId() const noexcept {
		const std::scoped_lock protect{mutex};
		return instance_id;
	}

	/**
	 * Return to the initial state (#TransportState::IDLE, default
	 * #TransportInfo, instance "0").
	 */
	void Reset() noexcept;

private:
	void Notify(TransportState old_state, TransportState new_state) noexcept {
		if (old_state != new_state && listener != nullptr)
			listener->OnTransportStateChanged(old_state, new_state);
	}
};
