// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "DeviceCache.hxx"

#include <algorithm>

DevicePtr
DeviceCache::GetByUdn(const std::string &udn) const noexcept
{
	const std::scoped_lock protect{mutex};

	const auto i = by_udn.find(udn);
	return i != by_udn.end() ? i->second.device : nullptr;
}

DevicePtr
DeviceCache::GetByLocation(const std::string &location) const noexcept
{
	const std::scoped_lock protect{mutex};

	const auto i = by_location.find(location);
	if (i == by_location.end())
		return nullptr;

	const auto j = by_udn.find(i->second);
	return j != by_udn.end() ? j->second.device : nullptr;
}

DeviceList
DeviceCache::GetAll() const noexcept
{
	DeviceList result;

	{
		const std::scoped_lock protect{mutex};
		result.reserve(by_udn.size());
		for (const auto &[udn, entry] : by_udn)
			result.push_back(entry.device);
	}

	std::sort(result.begin(), result.end(), [](const auto &a, const auto &b){
		return a->GetUdn() < b->GetUdn();
	});

	return result;
}

std::size_t
DeviceCache::GetSize() const noexcept
{
	const std::scoped_lock protect{mutex};
	return by_udn.size();
}

bool
DeviceCache::IsTombstoned(const std::string &udn,
			  Clock::time_point now) const noexcept
{
	const std::scoped_lock protect{mutex};

	const auto i = tombstones.find(udn);
	return i != tombstones.end() && now - i->second < tombstone_grace;
}

void
DeviceCache::EraseLocked(const std::string &udn, bool tombstone,
			 Clock::time_point now) noexcept
{
	const auto i = by_udn.find(udn);
	if (i == by_udn.end())
		return;

	/* another device may have taken over the location */
	const auto l = by_location.find(i->second.device->location);
	if (l != by_location.end() && l->second == udn)
		by_location.erase(l);

	by_udn.erase(i);

	if (tombstone)
		tombstones.insert_or_assign(udn, now);
}

void
DeviceCache::PurgeTombstonesLocked(Clock::time_point now) noexcept
{
	std::erase_if(tombstones, [this, now](const auto &i){
		return now - i.second >= tombstone_grace;
	});
}

DevicePtr
DeviceCache::EvictLocked() noexcept
{
	const auto oldest = std::min_element(by_udn.begin(), by_udn.end(),
					     [](const auto &a, const auto &b){
		return a.second.last_seen < b.second.last_seen;
	});
	if (oldest == by_udn.end())
		return nullptr;

	auto device = oldest->second.device;

	const auto l = by_location.find(device->location);
	if (l != by_location.end() && l->second == device->GetUdn())
		by_location.erase(l);

	by_udn.erase(oldest);
	return device;
}

DeviceList
DeviceCache::Apply(const Batch &batch, Clock::time_point now) noexcept
{
	DeviceList evicted;

	const std::scoped_lock protect{mutex};

	PurgeTombstonesLocked(now);

	for (const auto &udn : batch.removals)
		EraseLocked(udn, batch.tombstone, now);

	for (const auto &[device, max_age] : batch.upserts) {
		const auto &udn = device->GetUdn();

		auto i = by_udn.find(udn);
		if (i != by_udn.end()) {
			/* refresh: the location may have changed */
			const auto &old_location = i->second.device->location;
			if (old_location != device->location) {
				const auto l = by_location.find(old_location);
				if (l != by_location.end() && l->second == udn)
					by_location.erase(l);
			}

			i->second = Entry{device, now, max_age};
		} else {
			if (by_udn.size() >= capacity)
				if (auto e = EvictLocked())
					evicted.emplace_back(std::move(e));

			by_udn.emplace(udn, Entry{device, now, max_age});
		}

		/* a re-announced device is alive again */
		tombstones.erase(udn);

		by_location.insert_or_assign(device->location, udn);
	}

	return evicted;
}

bool
DeviceCache::Touch(const std::string &udn, std::chrono::seconds max_age,
		   Clock::time_point now) noexcept
{
	const std::scoped_lock protect{mutex};

	const auto i = by_udn.find(udn);
	if (i == by_udn.end())
		return false;

	i->second.last_seen = now;
	i->second.max_age = max_age;
	return true;
}

std::vector<std::string>
DeviceCache::CollectExpired(Clock::time_point now,
			    Clock::duration grace) const noexcept
{
	std::vector<std::string> result;

	const std::scoped_lock protect{mutex};
	for (const auto &[udn, entry] : by_udn)
		if (now > entry.last_seen + entry.max_age + grace)
			result.push_back(udn);

	return result;
}

void
DeviceCache::Clear() noexcept
{
	const std::scoped_lock protect{mutex};
	by_udn.clear();
	by_location.clear();
	tombstones.clear();
}
