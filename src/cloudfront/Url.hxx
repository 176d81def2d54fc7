// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace CloudFront {

/**
 * The components of an absolute URL.  All members point into the
 * string passed to ParseBaseUrl().
 */
struct ParsedUrl {
	std::string_view scheme;

	/**
	 * Host and optional port (and userinfo, if present).
	 */
	std::string_view authority;

	/**
	 * Begins with a slash or is empty.
	 */
	std::string_view path;

	/**
	 * Without the question mark; nulled if there is none.
	 */
	std::string_view query;

	/**
	 * Without the hash; nulled if there is none.
	 */
	std::string_view fragment;
};

/**
 * Split an absolute URL ("scheme://authority/path?query#fragment")
 * into its components.
 *
 * Throws #MalformedUrlError on error.
 */
ParsedUrl
ParseBaseUrl(std::string_view url);

/**
 * Percent-encode all characters of the given URL path which are
 * neither a RFC 3986 "pchar" nor a slash.  Existing "%XX" escapes are
 * left alone.
 */
std::string
EscapeUrlPath(std::string_view path);

/**
 * Build the signed URL: the base URL's scheme (in lower case) and
 * authority, the given path and the caller's query string (if any)
 * followed by the "Expires", "Signature" and "Key-Pair-Id"
 * parameters, in this order.
 *
 * @param query_string the raw query string (without question mark),
 * copied verbatim; may be empty
 */
std::string
AssembleSignedUrl(const ParsedUrl &base, std::string_view path,
		  std::string_view query_string, int64_t expires,
		  std::string_view signature_b64,
		  std::string_view key_pair_id);

} // namespace CloudFront
