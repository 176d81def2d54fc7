// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Cookie.hxx"
#include "lib/openssl/UniqueEVP.hxx"

#include <chrono>
#include <string>
#include <string_view>

namespace CloudFront {

/**
 * Creates canned-policy signed URLs and signed cookies for private
 * content on the delivery network.
 *
 * An instance holds the signing identity (base URL, key pair id and
 * RSA private key) and never modifies it after construction; all
 * methods are const and may be called concurrently from multiple
 * threads.
 */
class Signer {
	std::string base_url;
	std::string key_pair_id;
	UniqueEVP_PKEY key;

public:
	/**
	 * Throws std::invalid_argument if the key is missing or not an
	 * RSA key.
	 *
	 * @param _base_url the URL of the distribution,
	 * e.g. "https://d111111abcdef8.cloudfront.net/"
	 * @param _key_pair_id the identifier the delivery network
	 * assigned to the public key
	 */
	Signer(std::string _base_url, std::string _key_pair_id,
	       UniqueEVP_PKEY _key);

	Signer(Signer &&) noexcept = default;

	const std::string &GetBaseUrl() const noexcept {
		return base_url;
	}

	const std::string &GetKeyPairId() const noexcept {
		return key_pair_id;
	}

	/**
	 * Create signed cookies granting access to the given resource
	 * (relative to the base URL) until the given time.
	 *
	 * Throws on error.
	 */
	SignedCookie Cookie(std::string_view resource,
			    std::chrono::system_clock::time_point expires) const;

	/**
	 * Create a signed URL with a canned policy.
	 *
	 * Throws on error (including #MalformedUrlError if the base
	 * URL cannot be parsed).
	 *
	 * @param path the URL path; replaces the path of the base URL
	 * @param query_string an optional query string (without the
	 * question mark) which will be preserved in the signed URL
	 */
	std::string CannedSignedUrl(std::string_view path,
				    std::string_view query_string,
				    std::chrono::system_clock::time_point expires) const;

private:
	std::string Sign(std::string_view policy) const;
};

/**
 * Determine the resource string that Signer::Cookie() puts into the
 * policy: the base URL without trailing slash, a slash, then the
 * resource.
 */
std::string
ResolveCookieResource(std::string_view base_url, std::string_view resource);

/**
 * Determine the resource string that Signer::CannedSignedUrl() puts
 * into the policy.
 *
 * Without a query string, this is the base URL joined with the path.
 * With a query string, it is just "path?query_string", without the
 * base URL; this is what the deployed signers produce and what
 * existing grants were issued with.
 */
std::string
ResolveUrlResource(std::string_view base_url, std::string_view path,
		   std::string_view query_string);

} // namespace CloudFront
