// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Exception.hxx"
#include "StringUtil.hxx"

static void
AppendMessage(std::string &dest, const char *separator,
	      std::string_view msg) noexcept
{
	if (!dest.empty())
		dest += separator;

	/* collapse multi-line messages (e.g. from expat or curl) into
	   one log line */
	bool space = false;
	for (const char ch : Strip(msg)) {
		if (IsWhitespaceASCII(ch)) {
			space = true;
			continue;
		}

		if (space) {
			space = false;
			dest.push_back(' ');
		}

		dest.push_back(ch);
	}
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	std::string result;

	while (ep) {
		try {
			std::rethrow_exception(ep);
		} catch (const std::exception &e) {
			AppendMessage(result, separator, e.what());

			const auto *ne = dynamic_cast<const std::nested_exception *>(&e);
			ep = ne != nullptr ? ne->nested_ptr() : nullptr;
		} catch (const std::nested_exception &ne) {
			ep = ne.nested_ptr();
		} catch (const char *s) {
			AppendMessage(result, separator, s);
			ep = nullptr;
		} catch (...) {
			AppendMessage(result, separator, fallback);
			ep = nullptr;
		}
	}

	return result;
}
