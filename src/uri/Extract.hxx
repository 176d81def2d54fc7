// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Extract parts of an URI.
 */

#pragma once

#include <string_view>

/**
 * Return the scheme name (without the colon) or a nulled
 * std::string_view if the URI does not begin with a valid scheme
 * followed by "://".
 */
[[gnu::pure]]
std::string_view
UriScheme(std::string_view uri) noexcept;

/**
 * Return the URI part after the protocol specification (and after the
 * double slash).
 */
[[gnu::pure]]
std::string_view
UriAfterScheme(std::string_view uri) noexcept;

/**
 * Return the authority part (userinfo, host and port), i.e. everything
 * between the double slash and the first slash, question mark or
 * hash.
 */
[[gnu::pure]]
std::string_view
UriHostAndPort(std::string_view uri) noexcept;

/**
 * Returns the URI path (including the query and the fragment) or a
 * nulled std::string_view if the given URI has nothing after the
 * authority.
 */
[[gnu::pure]]
std::string_view
UriPathQueryFragment(std::string_view uri) noexcept;
