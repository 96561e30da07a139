// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "CastError.hxx"

#include <cassert>
#include <utility>
#include <variant>

/**
 * Either a value or a #CastError.  This is returned across the
 * boundaries where exceptions are not allowed to pass, so each call
 * site has to look at the failure path.
 */
template<typename T>
class CastResult {
	std::variant<T, CastError> value;

public:
	CastResult(T &&_value) noexcept
		:value(std::in_place_index<0>, std::move(_value)) {}

	CastResult(const T &_value)
		:value(std::in_place_index<0>, _value) {}

	CastResult(CastError &&error) noexcept
		:value(std::in_place_index<1>, std::move(error)) {}

	CastResult(const CastError &error)
		:value(std::in_place_index<1>, error) {}

	bool IsOk() const noexcept {
		return value.index() == 0;
	}

	explicit operator bool() const noexcept {
		return IsOk();
	}

	T &operator*() noexcept {
		assert(IsOk());
		return std::get<0>(value);
	}

	const T &operator*() const noexcept {
		assert(IsOk());
		return std::get<0>(value);
	}

	T *operator->() noexcept {
		return &**this;
	}

	const T *operator->() const noexcept {
		return &**this;
	}

	const CastError &GetError() const noexcept {
		assert(!IsOk());
		return std::get<1>(value);
	}

	/**
	 * Return the value or throw the error as #CastException.
	 */
	T &GetOrThrow() {
		if (!IsOk())
			GetError().Throw();
		return **this;
	}
};
