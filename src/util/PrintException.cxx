// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "PrintException.hxx"

#include <stdio.h>

void
PrintException(const std::exception_ptr &ep) noexcept
{
	for (std::exception_ptr i = ep; i;) {
		try {
			std::rethrow_exception(i);
		} catch (const std::exception &e) {
			fprintf(stderr, "%s\n", e.what());

			const auto *nested = dynamic_cast<const std::nested_exception *>(&e);
			i = nested != nullptr ? nested->nested_ptr() : nullptr;
		} catch (const char *s) {
			fprintf(stderr, "%s\n", s);
			break;
		} catch (...) {
			fprintf(stderr, "Unrecognized exception\n");
			break;
		}
	}
}
