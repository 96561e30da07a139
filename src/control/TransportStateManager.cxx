// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "TransportStateManager.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

static constexpr Domain transport_domain("transport");

bool
TransportStateManager::Transition(TransportState to) noexcept
{
	TransportState old_state;

	{
		const std::scoped_lock protect{mutex};
		old_state = state;

		if (!IsValidTransition(old_state, to)) {
			FmtDebug(transport_domain, "rejected transition {} -> {}",
				 ToString(old_state), ToString(to));
			return false;
		}

		state = to;
	}

	Notify(old_state, to);
	return true;
}

void
TransportStateManager::ForceState(TransportState to) noexcept
{
	TransportState old_state;

	{
		const std::scoped_lock protect{mutex};
		old_state = state;
		state = to;
	}

	Notify(old_state, to);
}

/**
 * Copy a value from the SOAP response, or keep the old one if the
 * renderer did not send it.
 */
static void
CopyValue(std::string &dest, const SoapValues &values, const char *name) noexcept
{
	if (auto i = values.find(name); i != values.end() && !i->second.empty())
		dest = i->second;
}

TransportInfo
TransportStateManager::Reconcile(const SoapValues &values) noexcept
{
	TransportState old_state, new_state;
	TransportInfo result;

	{
		const std::scoped_lock protect{mutex};

		CopyValue(info.state, values, "CurrentTransportState");
		CopyValue(info.status, values, "CurrentTransportStatus");
		CopyValue(info.speed, values, "CurrentSpeed");

		old_state = state;
		new_state = ParseUpnpTransportState(info.state);

		if (!IsValidTransition(old_state, new_state))
			FmtWarning(transport_domain,
				   "renderer reported unexpected transition {} -> {}",
				   ToString(old_state), ToString(new_state));

		state = new_state;
		result = info;
	}

	Notify(old_state, new_state);
	return result;
}

void
TransportStateManager::Reset() noexcept
{
	TransportState old_state;

	{
		const std::scoped_lock protect{mutex};
		old_state = state;
		state = TransportState::IDLE;
		info = {};
		instance_id = "0";
	}

	Notify(old_state, TransportState::IDLE);
}
