// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace CloudFront {

/* the cookie names the delivery network looks for */
constexpr std::string_view POLICY_COOKIE = "CloudFront-Policy";
constexpr std::string_view SIGNATURE_COOKIE = "CloudFront-Signature";
constexpr std::string_view KEY_PAIR_ID_COOKIE = "CloudFront-Key-Pair-Id";

/**
 * A signed grant in cookie form.  All three values must be presented
 * together; none of them is meaningful on its own.
 */
struct SignedCookie {
	/**
	 * UrlSafeBase64() of the policy document.
	 */
	std::string policy;

	/**
	 * UrlSafeBase64() of the RSA-SHA1 signature.
	 */
	std::string signature;

	std::string key_pair_id;
};

inline SignedCookie
AssembleCookie(std::string policy_b64, std::string signature_b64,
	       std::string key_pair_id) noexcept
{
	return {
		std::move(policy_b64),
		std::move(signature_b64),
		std::move(key_pair_id),
	};
}

} // namespace CloudFront
