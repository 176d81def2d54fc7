// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Verify URI parts.
 */

#pragma once

#include <string_view>

/**
 * Is this a valid domain name (i.e. host name) according to RFC 1034
 * 3.5?
 */
[[gnu::pure]]
bool
VerifyDomainName(std::string_view name) noexcept;

/**
 * Is this a valid "host:port" string according to RFC 3986 3.2.2 and
 * 3.2.3?  IPv6 addresses may be enclosed in square brackets.
 */
[[gnu::pure]]
bool
VerifyUriHostPort(std::string_view host_port) noexcept;

/**
 * Is this a valid URI authority ("[userinfo@]host[:port]", see RFC
 * 3986 3.2)?
 */
[[gnu::pure]]
bool
VerifyUriAuthority(std::string_view authority) noexcept;
