// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "CastError.hxx"
#include "lib/expat/ExpatParser.hxx"
#include "util/Exception.hxx"

using std::string_view_literals::operator""sv;

std::string_view
ToString(ErrorCategory category) noexcept
{
	switch (category) {
	case ErrorCategory::NETWORK:
		return "NETWORK"sv;
	case ErrorCategory::NETWORK_TIMEOUT:
		return "NETWORK_TIMEOUT"sv;
	case ErrorCategory::DISCOVERY:
		return "DISCOVERY"sv;
	case ErrorCategory::CONNECTION:
		return "CONNECTION"sv;
	case ErrorCategory::DEVICE_CONNECTION:
		return "DEVICE_CONNECTION"sv;
	case ErrorCategory::COMMUNICATION:
		return "COMMUNICATION"sv;
	case ErrorCategory::DEVICE:
		return "DEVICE"sv;
	case ErrorCategory::PLAYBACK:
		return "PLAYBACK"sv;
	case ErrorCategory::CONTROL:
		return "CONTROL"sv;
	case ErrorCategory::INVALID_PARAMETER:
		return "INVALID_PARAMETER"sv;
	case ErrorCategory::RESOURCE:
		return "RESOURCE"sv;
	case ErrorCategory::PARSING:
		return "PARSING"sv;
	case ErrorCategory::SECURITY:
		return "SECURITY"sv;
	case ErrorCategory::COMPATIBILITY:
		return "COMPATIBILITY"sv;
	case ErrorCategory::UNKNOWN:
		break;
	}

	return "UNKNOWN"sv;
}

void
CastError::Throw() const
{
	if (cause) {
		try {
			std::rethrow_exception(cause);
		} catch (...) {
			std::throw_with_nested(CastException(category, message));
		}
	}

	throw CastException(category, message);
}

[[gnu::pure]]
static ErrorCategory
Classify(std::exception_ptr ep) noexcept
{
	/* the outermost CastException wins: it was thrown by the code
	   which knew the most about the context */
	if (const auto *e = FindNested<CastException>(ep))
		return e->GetCategory();

	if (FindNested<ExpatError>(ep) != nullptr)
		return ErrorCategory::PARSING;

	if (FindNested<std::invalid_argument>(ep) != nullptr ||
	    FindNested<std::out_of_range>(ep) != nullptr)
		return ErrorCategory::INVALID_PARAMETER;

	if (FindNested<std::bad_alloc>(ep) != nullptr)
		return ErrorCategory::RESOURCE;

	return ErrorCategory::UNKNOWN;
}

CastError
MakeCastError(std::exception_ptr ep) noexcept
{
	return {Classify(ep), GetFullMessage(ep), ep};
}
