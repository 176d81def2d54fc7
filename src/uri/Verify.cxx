// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Verify.hxx"
#include "Chars.hxx"
#include "util/CharUtil.hxx"
#include "util/StringListVerify.hxx"
#include "util/StringSplit.hxx"
#include "util/StringVerify.hxx"

static constexpr bool
IsAlphaNumericDashASCII(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '-';
}

/**
 * Is this a valid domain label (i.e. host name segment) according to
 * RFC 1034 3.5?
 */
static constexpr bool
VerifyDomainLabel(std::string_view s) noexcept
{
	/* RFC 1035 2.3.4: domain labels are limited to 63 octets */
	if (s.empty() || s.size() > 63)
		return false;

	if (!IsAlphaNumericASCII(s.front()))
		return false;

	s.remove_prefix(1);
	if (s.empty())
		return true;

	if (!IsAlphaNumericASCII(s.back()))
		return false;

	s.remove_suffix(1);
	return CheckChars(s, IsAlphaNumericDashASCII);
}

bool
VerifyDomainName(std::string_view s) noexcept
{
	/* RFC 1035 2.3.4: domain names are limited to 255 octets */

	return s.size() <= 255 && IsNonEmptyListOf(s, '.', VerifyDomainLabel);
}

[[gnu::pure]]
static bool
VerifyPort(std::string_view s) noexcept
{
	return s.size() <= 5 &&
		CheckCharsNonEmpty(s, IsDigitASCII);
}

[[gnu::pure]]
static bool
VerifyIPv6Segment(std::string_view s) noexcept
{
	return s.size() <= 4 && CheckChars(s, IsHexDigit);
}

[[gnu::pure]]
static bool
VerifyIPv6(std::string_view host) noexcept
{
	return host.size() < 40 &&
		IsNonEmptyListOf(host, ':', VerifyIPv6Segment);
}

[[gnu::pure]]
static bool
VerifyUriHost(std::string_view host) noexcept
{
	if (host.find(':') != host.npos)
		return VerifyIPv6(host);

	return VerifyDomainName(host);
}

bool
VerifyUriHostPort(std::string_view host_port) noexcept
{
	if (host_port.empty())
		return false;

	if (host_port.front() == '[') {
		auto [host, port] = Split(host_port.substr(1), ']');
		if (port.data() == nullptr)
			/* syntax error: the closing bracket was not
			   found */
			return false;

		if (!port.empty()) {
			if (port.front() != ':')
				return false;

			port.remove_prefix(1);
			if (!VerifyPort(port))
				return false;
		}

		return VerifyUriHost(host);
	} else {
		auto [host, port] = SplitLast(host_port, ':');
		if (host.find(':') != host.npos)
			/* more than one colon: assume this is a
			   numeric IPv6 address (without a port
			   specification) */
			return VerifyIPv6(host_port);

		return VerifyUriHost(host) &&
			(port.data() == nullptr || VerifyPort(port));
	}
}

bool
VerifyUriAuthority(std::string_view authority) noexcept
{
	if (const auto [userinfo, host_port] = SplitLast(authority, '@');
	    host_port.data() != nullptr) {
		if (!CheckChars(userinfo, IsUriUserinfoChar))
			return false;

		authority = host_port;
	}

	return VerifyUriHostPort(authority);
}
