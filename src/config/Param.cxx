// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Param.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <exception>

void
ConfigParam::ThrowWithNested(ConfigOption option) const
{
	const auto name = GetConfigOptionName(option);

	if (line > 0)
		std::throw_with_nested(FmtRuntimeError("Invalid value for \"{}\" on line {}",
						       name, line));
	else
		std::throw_with_nested(FmtRuntimeError("Invalid value for \"{}\"",
						       name));
}
