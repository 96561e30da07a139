// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Router.hxx"
#include "MulticastLock.hxx"
#include "Observer.hxx"
#include "config/CastConfig.hxx"
#include "device/Description.hxx"
#include "device/DeviceRegistry.hxx"
#include "device/ServiceTypes.hxx"
#include "device/Util.hxx"
#include "error/CastError.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "net/HttpClient.hxx"
#include "util/Domain.hxx"
#include "util/ScopeExit.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <optional>

static constexpr Domain router_domain("router");

/**
 * The delay before the n-th retry of a description download is n
 * times this.
 */
static constexpr std::chrono::seconds DESCRIPTION_RETRY_STEP{1};

/**
 * How long StopSearch() waits for the listening task to release the
 * multicast lock.
 */
static constexpr std::chrono::seconds STOP_SEARCH_TIMEOUT{1};

/**
 * Is this an announcement we are interested in?  Devices announce
 * themselves once for each device and service type.
 */
[[gnu::pure]]
static bool
IsRendererType(std::string_view type_urn) noexcept
{
	return type_urn.empty() ||
		IsSameUpnpType(type_urn, media_renderer_device_type) ||
		IsSameUpnpType(type_urn, av_transport_service_type);
}

Router::Router(SsdpClient &_client, MulticastLock &_multicast_lock,
	       DeviceRegistry &_registry, HttpClient &_http,
	       WorkQueue &queue, const CastConfig &config) noexcept
	:client(_client), multicast_lock(_multicast_lock),
	 registry(_registry), http(_http),
	 default_timeout(config.search_timeout),
	 mx(config.search_mx),
	 description_retries(config.description_retries),
	 scope(queue, "discovery")
{
}

void
Router::Startup()
{
	const std::scoped_lock protect{mutex};
	if (running)
		return;

	scope.Restart();

	try {
		client.Open(*this);
	} catch (...) {
		std::throw_with_nested(CastException(ErrorCategory::DISCOVERY,
						     "Failed to start SSDP discovery"));
	}

	running = true;
	FmtDebug(router_domain, "started");
}

void
Router::Shutdown() noexcept
{
	StopSearch();

	if (!scope.CancelAndWait(std::chrono::seconds{5}))
		LogWarning(router_domain, "discovery tasks did not finish in time");

	{
		const std::scoped_lock protect{mutex};
		if (!running)
			return;

		running = false;
		pending_fetches.clear();
		ignored.clear();
	}

	client.Close();
	FmtDebug(router_domain, "stopped");
}

void
Router::ReportError(const CastError &error) noexcept
{
	LogCastError(LogLevel::WARNING, router_domain, {}, error);

	if (observer != nullptr)
		observer->OnDiscoveryError(error);
}

bool
Router::Search(Clock::duration timeout) noexcept
{
	try {
		Startup();
	} catch (...) {
		ReportError(MakeCastError(std::current_exception()));
		return false;
	}

	{
		const std::scoped_lock protect{mutex};
		if (searching)
			return true;

		searching = true;
		stop_search = false;
	}

	registry.ExpireDevices();

	/* the lease is shared with the listening task, which releases
	   it when the search ends; std::function requires a copyable
	   object */
	auto lease = std::make_shared<MulticastLease>(multicast_lock);
	if (!*lease)
		/* unicast responses to our M-SEARCH still arrive */
		ReportError({ErrorCategory::DISCOVERY,
			     "Multicast reception is not available; only search responses will be received"});

	if (!scope.Submit([this, lease, timeout](std::stop_token token){
		RunSearch(*lease, timeout, token);
	})) {
		FinishSearch(*lease);
		return false;
	}

	if (observer != nullptr)
		observer->OnSearchStarted();

	return true;
}

void
Router::FinishSearch(MulticastLease &lease) noexcept
{
	lease.Release();

	{
		const std::scoped_lock protect{mutex};
		searching = false;
		stop_search = false;
	}

	cond.notify_all();
}

void
Router::RunSearch(MulticastLease &lease, Clock::duration timeout,
		  std::stop_token token) noexcept
{
	auto finish = MakeScopeExit([this, &lease]{
		FinishSearch(lease);

		if (observer != nullptr)
			observer->OnSearchFinished();
	});

	FmtDebug(router_domain, "searching for {}", media_renderer_device_type);

	try {
		client.Search(media_renderer_device_type, mx);
	} catch (...) {
		ReportError(MakeCastError(NestCurrentException(CastException(ErrorCategory::DISCOVERY,
									     "M-SEARCH failed"))));
		return;
	}

	std::unique_lock lock{mutex};
	cond.wait_for(lock, token, timeout, [this]{ return stop_search; });

	FmtDebug(router_domain, "search finished, {} devices known",
		 registry.GetDeviceCount());
}

void
Router::StopSearch() noexcept
{
	std::unique_lock lock{mutex};
	if (!searching)
		return;

	stop_search = true;
	cond.notify_all();

	if (!cond.wait_for(lock, STOP_SEARCH_TIMEOUT, [this]{ return !searching; }))
		LogWarning(router_domain, "listening task did not stop in time");
}

bool
Router::WaitSearchFinished(Clock::duration timeout) noexcept
{
	std::unique_lock lock{mutex};
	return cond.wait_for(lock, timeout, [this]{ return !searching; });
}

bool
Router::WaitIdle(Clock::duration timeout) noexcept
{
	return scope.WaitIdle(timeout);
}

void
Router::OnSsdpMessage(const SsdpMessage &_message) noexcept
{
	SsdpMessage message = _message;
	message.udn = NormalizeUdn(message.udn);

	if (message.udn.empty()) {
		LogDebug(router_domain, "discarding SSDP message without USN");
		return;
	}

	switch (message.type) {
	case SsdpMessage::Type::BYEBYE:
		FmtDebug(router_domain, "byebye from {}", message.udn);
		registry.RemoveDeviceById(message.udn);

		{
			const std::scoped_lock protect{mutex};
			ignored.erase(message.udn);
		}

		return;

	case SsdpMessage::Type::RESPONSE:
		{
			const std::scoped_lock protect{mutex};
			if (!searching)
				/* late response to an old search */
				return;
		}

		if (registry.IsTombstoned(message.udn)) {
			FmtDebug(router_domain,
				 "ignoring late response from removed device {}",
				 message.udn);
			return;
		}

		OnAlive(message);
		return;

	case SsdpMessage::Type::ALIVE:
		OnAlive(message);
		return;
	}
}

inline void
Router::OnAlive(const SsdpMessage &message) noexcept
{
	if (!IsRendererType(message.type_urn))
		return;

	if (GetUrlHost(message.location).empty()) {
		FmtDebug(router_domain, "discarding SSDP message from {} with bad location \"{}\"",
			 message.udn, message.location);
		return;
	}

	const auto max_age = message.max_age.count() > 0
		? message.max_age
		: DeviceRegistry::DEFAULT_MAX_AGE;

	if (const auto device = registry.GetDeviceById(message.udn);
	    device != nullptr && device->location == message.location) {
		/* already known; no need to download the description
		   again */
		registry.Touch(message.udn, max_age);
		return;
	}

	{
		const std::scoped_lock protect{mutex};
		if (!running || ignored.contains(message.udn) ||
		    !pending_fetches.insert(message.udn).second)
			return;
	}

	const bool submitted = scope.Submit([this, udn=message.udn,
					     location=message.location,
					     max_age](std::stop_token token){
		FetchDescription(udn, location, max_age, token);
	});

	if (!submitted) {
		const std::scoped_lock protect{mutex};
		pending_fetches.erase(message.udn);
	}
}

/**
 * Download and parse a device description.
 *
 * Throws on error.
 */
static Device
DownloadDescription(HttpSession &session, const std::string &location)
{
	auto response = session.Get(location);
	if (!response.IsSuccess())
		throw CastException(ErrorCategory::COMMUNICATION,
				    fmt::format("HTTP status {}", response.status));

	return ParseDeviceDescription(location, response.body);
}

void
Router::FetchDescription(const std::string &udn, const std::string &location,
			 std::chrono::seconds max_age,
			 std::stop_token token) noexcept
{
	auto done = MakeScopeExit([this, &udn]{
		const std::scoped_lock protect{mutex};
		pending_fetches.erase(udn);
	});

	FmtDebug(router_domain, "downloading description of {} from {}",
		 udn, location);

	std::unique_ptr<HttpSession> session;
	std::optional<Device> device;

	for (unsigned attempt = 1;; ++attempt) {
		try {
			if (!session)
				session = http.OpenSession();

			device.emplace(DownloadDescription(*session, location));
			break;
		} catch (...) {
			if (attempt >= description_retries) {
				FmtWarning(router_domain,
					   "Failed to get description of {} from {}: {}",
					   udn, location, std::current_exception());
				return;
			}

			FmtDebug(router_domain, "attempt {} to get {} failed: {}",
				 attempt, location, std::current_exception());
		}

		if (!TaskScope::SleepFor(token, attempt * DESCRIPTION_RETRY_STEP))
			return;
	}

	if (device->GetUdn() != udn) {
		if (NormalizeUdn(device->GetUdn()) != udn) {
			FmtWarning(router_domain, "description of {} at {} has a different UDN: {}",
				   udn, location, device->GetUdn());

			const std::scoped_lock protect{mutex};
			ignored.insert(udn);
			return;
		}

		/* register it with the UDN used in SSDP messages, so
		   "alive" and "byebye" find it */
		*device = Device(udn, std::move(*device));
	}

	if (!device->IsMediaRenderer()) {
		FmtDebug(router_domain, "ignoring {} ({}): not a media renderer",
			 device->GetDisplayName(), device->device_type);

		const std::scoped_lock protect{mutex};
		ignored.insert(udn);
		return;
	}

	if (token.stop_requested())
		return;

	registry.AddDevice(std::make_shared<const Device>(std::move(*device)),
			   max_age);
}
