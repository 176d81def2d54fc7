// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Extract.hxx"
#include "util/CharUtil.hxx"
#include "util/StringSplit.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

/**
 * @see RFC 3986 3.1; schemes are case-insensitive
 */
static constexpr bool
IsValidSchemeStart(char ch) noexcept
{
	return IsAlphaASCII(ch);
}

static constexpr bool
IsValidSchemeChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '+' || ch == '.' || ch == '-';
}

[[gnu::pure]]
static bool
IsValidScheme(std::string_view p) noexcept
{
	if (p.empty() || !IsValidSchemeStart(p.front()))
		return false;

	p.remove_prefix(1);
	return std::all_of(p.begin(), p.end(), IsValidSchemeChar);
}

static constexpr bool
IsAuthorityTerminator(char ch) noexcept
{
	return ch == '/' || ch == '?' || ch == '#';
}

std::string_view
UriScheme(const std::string_view uri) noexcept
{
	const auto [scheme, rest] = Split(uri, ':');
	if (rest.data() == nullptr || !IsValidScheme(scheme) ||
	    !rest.starts_with("//"sv))
		return {};

	return scheme;
}

std::string_view
UriAfterScheme(std::string_view uri) noexcept
{
	if (uri.size() > 2 && uri[0] == '/' && uri[1] == '/' && uri[2] != '/')
		return uri.substr(2);

	const auto [scheme, rest] = Split(uri, ':');
	if (IsValidScheme(scheme) &&
	    rest.size() > 2 && rest[0] == '/' && rest[1] == '/' &&
	    rest[2] != '/')
		return rest.substr(2);

	return {};
}

std::string_view
UriHostAndPort(std::string_view _uri) noexcept
{
	const auto uri = UriAfterScheme(_uri);
	if (uri.data() == nullptr)
		return {};

	return SplitBefore(uri, IsAuthorityTerminator).first;
}

std::string_view
UriPathQueryFragment(std::string_view _uri) noexcept
{
	const auto uri = UriAfterScheme(_uri);
	if (uri.data() == nullptr)
		return _uri;

	return SplitBefore(uri, IsAuthorityTerminator).second;
}
