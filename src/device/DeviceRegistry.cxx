// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "DeviceRegistry.hxx"
#include "RegistryListener.hxx"
#include "Log.hxx"
#include "util/Domain.hxx"

#include <algorithm>
#include <unordered_set>

static constexpr Domain registry_domain("registry");

void
DeviceRegistry::AddListener(RegistryListener &listener) noexcept
{
	const std::scoped_lock protect{mutation_mutex};

	if (std::find(listeners.begin(), listeners.end(), &listener) == listeners.end())
		listeners.push_back(&listener);
}

void
DeviceRegistry::RemoveListener(RegistryListener &listener) noexcept
{
	const std::scoped_lock protect{mutation_mutex};
	std::erase(listeners, &listener);
}

inline void
DeviceRegistry::NotifyAdded(const DevicePtr &device) noexcept
{
	for (auto *listener : listeners)
		listener->OnDeviceAdded(device);
}

inline void
DeviceRegistry::NotifyUpdated(const DevicePtr &device) noexcept
{
	for (auto *listener : listeners)
		listener->OnDeviceUpdated(device);
}

inline void
DeviceRegistry::NotifyRemoved(const DevicePtr &device) noexcept
{
	for (auto *listener : listeners)
		listener->OnDeviceRemoved(device);
}

void
DeviceRegistry::NotifyListUpdated() noexcept
{
	if (listeners.empty())
		return;

	const auto snapshot = cache.GetAll();
	for (auto *listener : listeners)
		listener->OnDeviceListUpdated(snapshot);
}

bool
DeviceRegistry::AddDevice(DevicePtr device,
			  std::chrono::seconds max_age) noexcept
{
	const std::scoped_lock protect{mutation_mutex};

	const bool is_new = cache.GetByUdn(device->GetUdn()) == nullptr;

	DeviceCache::Batch batch;
	batch.upserts.push_back({device, max_age});
	const auto evicted = cache.Apply(batch);

	for (const auto &e : evicted) {
		FmtInfo(registry_domain, "evicted \"{}\" ({})",
			e->GetDisplayName(), e->GetUdn());
		NotifyRemoved(e);
	}

	if (is_new) {
		FmtNotice(registry_domain, "found \"{}\" ({})",
			  device->GetDisplayName(), device->GetUdn());
		NotifyAdded(device);
	} else {
		FmtDebug(registry_domain, "updated \"{}\" ({})",
			 device->GetDisplayName(), device->GetUdn());
		NotifyUpdated(device);
	}

	NotifyListUpdated();
	return is_new;
}

unsigned
DeviceRegistry::RemoveLocked(const std::vector<std::string> &udns) noexcept
{
	DeviceList removed;
	DeviceCache::Batch batch;

	for (const auto &udn : udns) {
		if (auto device = cache.GetByUdn(udn)) {
			removed.emplace_back(std::move(device));
			batch.removals.push_back(udn);
		}
	}

	if (removed.empty())
		return 0;

	cache.Apply(batch);

	for (const auto &device : removed) {
		FmtNotice(registry_domain, "lost \"{}\" ({})",
			  device->GetDisplayName(), device->GetUdn());
		NotifyRemoved(device);
	}

	NotifyListUpdated();
	return removed.size();
}

bool
DeviceRegistry::RemoveDeviceById(const std::string &udn) noexcept
{
	const std::scoped_lock protect{mutation_mutex};
	return RemoveLocked({udn}) > 0;
}

void
DeviceRegistry::UpdateDeviceList(const DeviceList &devices) noexcept
{
	const std::scoped_lock protect{mutation_mutex};

	const auto current = cache.GetAll();

	std::unordered_set<std::string> wanted;
	for (const auto &device : devices)
		wanted.insert(device->GetUdn());

	DeviceCache::Batch batch;
	DeviceList removed, added, updated;

	for (const auto &device : current) {
		if (!wanted.contains(device->GetUdn())) {
			batch.removals.push_back(device->GetUdn());
			removed.push_back(device);
		}
	}

	/* collapse duplicates; the last one wins */
	DeviceList unique;
	for (const auto &device : devices) {
		auto i = std::find_if(unique.begin(), unique.end(),
				      [&device](const auto &d){
			return d->GetUdn() == device->GetUdn();
		});

		if (i != unique.end())
			*i = device;
		else
			unique.push_back(device);
	}

	for (const auto &device : unique) {
		batch.upserts.push_back({device, DEFAULT_MAX_AGE});

		const bool known = std::any_of(current.begin(), current.end(),
					       [&device](const auto &d){
			return d->GetUdn() == device->GetUdn();
		});

		(known ? updated : added).push_back(device);
	}

	/* a list larger than the cache capacity evicts entries which
	   were upserted by this very batch */
	auto evicted = cache.Apply(batch);

	/* skip entries upserted again later in the batch, and
	   duplicates */
	std::unordered_set<std::string> seen;
	std::erase_if(evicted, [this, &seen](const auto &device){
		return cache.GetByUdn(device->GetUdn()) != nullptr ||
			!seen.insert(device->GetUdn()).second;
	});

	const auto erase_evicted = [&evicted](DeviceList &list){
		std::erase_if(list, [&evicted](const auto &device){
			return std::any_of(evicted.begin(), evicted.end(),
					   [&device](const auto &e){
				return e->GetUdn() == device->GetUdn();
			});
		});
	};

	for (const auto &device : removed)
		NotifyRemoved(device);

	for (const auto &device : evicted) {
		const bool was_added = std::any_of(added.begin(), added.end(),
						   [&device](const auto &d){
			return d->GetUdn() == device->GetUdn();
		});

		/* listeners never saw a device which was added and
		   evicted in the same batch */
		if (!was_added)
			NotifyRemoved(device);
	}

	erase_evicted(added);
	erase_evicted(updated);

	for (const auto &device : added)
		NotifyAdded(device);

	for (const auto &device : updated)
		NotifyUpdated(device);

	NotifyListUpdated();
}

void
DeviceRegistry::ClearDevices() noexcept
{
	const std::scoped_lock protect{mutation_mutex};

	const auto current = cache.GetAll();

	DeviceCache::Batch batch;
	batch.tombstone = false;
	for (const auto &device : current)
		batch.removals.push_back(device->GetUdn());

	cache.Apply(batch);

	for (const auto &device : current)
		NotifyRemoved(device);

	NotifyListUpdated();

	cache.Clear();
}

unsigned
DeviceRegistry::ExpireDevices(Clock::time_point now) noexcept
{
	const std::scoped_lock protect{mutation_mutex};

	const auto expired = cache.CollectExpired(now, EXPIRY_GRACE);
	if (expired.empty())
		return 0;

	FmtDebug(registry_domain, "expiring {} devices", expired.size());
	return RemoveLocked(expired);
}
