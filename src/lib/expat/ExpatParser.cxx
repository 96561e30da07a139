// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "ExpatParser.hxx"

#include <limits>

#include <string.h>

void
ExpatParser::Parse(std::string_view src, bool is_final)
{
	/* XML_Parse() takes an "int" length; feed huge documents in
	   chunks */
	constexpr std::size_t max_chunk = std::numeric_limits<int>::max();

	while (src.size() > max_chunk) {
		if (XML_Parse(parser, src.data(), int(max_chunk), false) != XML_STATUS_OK)
			throw ExpatError(parser);
		src.remove_prefix(max_chunk);
	}

	if (XML_Parse(parser, src.data(), int(src.size()), is_final) != XML_STATUS_OK)
		throw ExpatError(parser);
}

const char *
ExpatParser::GetAttribute(const XML_Char **atts,
			  const char *name) noexcept
{
	for (unsigned i = 0; atts[i] != nullptr; i += 2)
		if (strcmp(atts[i], name) == 0)
			return atts[i + 1];

	return nullptr;
}
