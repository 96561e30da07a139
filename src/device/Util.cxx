// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Util.hxx"
#include "util/StringUtil.hxx"

std::string
ConcatUrl(std::string_view s1, std::string_view s2) noexcept
{
	std::string out(s1);
	if (s2.empty())
		return out;

	if (!out.empty() && out.back() == '/') {
		if (s2.front() == '/')
			out.pop_back();
	} else {
		if (s2.front() != '/')
			out.push_back('/');
	}

	out += s2;
	return out;
}

/**
 * Returns the position of the first character after "scheme://", or
 * npos if this is not an absolute URL.
 */
[[gnu::pure]]
static std::size_t
FindAuthority(std::string_view url) noexcept
{
	const auto p = url.find("://");
	return p == url.npos ? p : p + 3;
}

std::string
GetParentUrl(std::string_view url) noexcept
{
	const auto authority = FindAuthority(url);
	const auto path = authority == url.npos
		? 0
		: url.find('/', authority);
	if (path == url.npos)
		/* no path: the root is the parent */
		return std::string{url} + '/';

	/* ignore the query string */
	auto end = url.find_first_of("?#", path);
	if (end != url.npos)
		url = url.substr(0, end);

	const auto slash = url.rfind('/');
	return std::string{url.substr(0, slash + 1)};
}

std::string_view
GetUrlHost(std::string_view url) noexcept
{
	const auto authority = FindAuthority(url);
	if (authority == url.npos)
		return {};

	url.remove_prefix(authority);
	const auto end = url.find_first_of("/?#");
	if (end != url.npos)
		url = url.substr(0, end);

	/* strip credentials */
	const auto at = url.rfind('@');
	if (at != url.npos)
		url.remove_prefix(at + 1);

	return url;
}

std::string
ResolveUrl(std::string_view base, std::string_view url) noexcept
{
	url = Strip(url);
	if (url.empty())
		return {};

	if (FindAuthority(url) != url.npos)
		/* already absolute */
		return std::string{url};

	if (url.front() == '/') {
		/* absolute path: keep only scheme and authority of the
		   base */
		const auto authority = FindAuthority(base);
		if (authority != base.npos) {
			const auto path = base.find('/', authority);
			if (path != base.npos)
				base = base.substr(0, path);
		}
	}

	return ConcatUrl(base, url);
}

std::string
GetUrlExtension(std::string_view url) noexcept
{
	const auto end = url.find_first_of("?#");
	if (end != url.npos)
		url = url.substr(0, end);

	const auto slash = url.rfind('/');
	if (slash != url.npos)
		url.remove_prefix(slash + 1);

	const auto dot = url.rfind('.');
	if (dot == url.npos)
		return {};

	return ToLowerASCII(url.substr(dot + 1));
}

std::string
NormalizeUdn(std::string_view udn) noexcept
{
	return ToLowerASCII(Strip(udn));
}
