// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "Category.hxx"

#include <exception>
#include <stdexcept>
#include <string>

/**
 * An exception carrying an #ErrorCategory.  This is thrown inside
 * the library; at the executor and handler boundaries it is
 * converted to a #CastError value.
 */
class CastException : public std::runtime_error {
	ErrorCategory category;

public:
	CastException(ErrorCategory _category, const char *_msg)
		:std::runtime_error(_msg), category(_category) {}

	CastException(ErrorCategory _category, const std::string &_msg)
		:std::runtime_error(_msg), category(_category) {}

	ErrorCategory GetCategory() const noexcept {
		return category;
	}
};

/**
 * A structured error value: category, human-readable message and
 * the optional underlying exception for diagnostics.
 */
struct CastError {
	ErrorCategory category = ErrorCategory::UNKNOWN;

	std::string message;

	std::exception_ptr cause;

	CastError() = default;

	CastError(ErrorCategory _category, std::string _message,
		  std::exception_ptr _cause={}) noexcept
		:category(_category), message(std::move(_message)),
		 cause(std::move(_cause)) {}

	unsigned GetCode() const noexcept {
		return GetErrorCode(category);
	}

	/**
	 * Rethrow as #CastException, nesting the cause (if any).
	 */
	[[noreturn]]
	void Throw() const;
};

/**
 * Convert an exception to a #CastError.  The category is taken from
 * the outermost #CastException found in the nested chain; other
 * well-known exception types are classified heuristically.  The
 * message contains the whole nested message chain.
 */
[[gnu::pure]]
CastError
MakeCastError(std::exception_ptr ep) noexcept;
