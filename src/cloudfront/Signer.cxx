// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Signer.hxx"
#include "Base64.hxx"
#include "Policy.hxx"
#include "Sign.hxx"
#include "Url.hxx"
#include "io/Logger.hxx"
#include "lib/openssl/Key.hxx"
#include "util/SpanCast.hxx"

#include <stdexcept>
#include <utility>

namespace CloudFront {

static const LLogger logger("cloudfront");

static constexpr std::string_view
StripTrailingSlash(std::string_view s) noexcept
{
	if (s.ends_with('/'))
		s.remove_suffix(1);
	return s;
}

static constexpr std::string_view
StripLeadingSlash(std::string_view s) noexcept
{
	if (s.starts_with('/'))
		s.remove_prefix(1);
	return s;
}

static std::string
JoinUrl(std::string_view base_url, std::string_view path)
{
	base_url = StripTrailingSlash(base_url);

	std::string result;
	result.reserve(base_url.size() + 1 + path.size());
	result.append(base_url);
	result.push_back('/');
	result.append(path);
	return result;
}

std::string
ResolveCookieResource(std::string_view base_url, std::string_view resource)
{
	return JoinUrl(base_url, resource);
}

std::string
ResolveUrlResource(std::string_view base_url, std::string_view path,
		   std::string_view query_string)
{
	if (query_string.empty())
		return JoinUrl(base_url, StripLeadingSlash(path));

	std::string result;
	result.reserve(path.size() + 1 + query_string.size());
	result.append(path);
	result.push_back('?');
	result.append(query_string);
	return result;
}

Signer::Signer(std::string _base_url, std::string _key_pair_id,
	       UniqueEVP_PKEY _key)
	:base_url(std::move(_base_url)),
	 key_pair_id(std::move(_key_pair_id)),
	 key(std::move(_key))
{
	if (!key)
		throw std::invalid_argument{"No private key"};

	if (!IsRsaKey(*key))
		throw std::invalid_argument{"RSA key expected"};
}

inline std::string
Signer::Sign(std::string_view policy) const
{
	return UrlSafeBase64(SignPolicy(*key, AsBytes(policy)));
}

SignedCookie
Signer::Cookie(std::string_view resource,
	       std::chrono::system_clock::time_point expires) const
{
	const auto resolved = ResolveCookieResource(base_url, resource);
	logger.Fmt(5, "Signing cookie for '{}' until {}",
		   resolved, ToEpochSeconds(expires));

	const auto policy = BuildPolicy(resolved, expires);
	auto signature = Sign(policy);

	return AssembleCookie(UrlSafeBase64(policy), std::move(signature),
			      key_pair_id);
}

std::string
Signer::CannedSignedUrl(std::string_view path,
			std::string_view query_string,
			std::chrono::system_clock::time_point expires) const
{
	const auto resolved = ResolveUrlResource(base_url, path, query_string);
	const auto epoch = ToEpochSeconds(expires);
	logger.Fmt(5, "Signing URL for '{}' until {}", resolved, epoch);

	const auto policy = BuildPolicy(resolved, expires);
	const auto signature = Sign(policy);

	const auto base = ParseBaseUrl(base_url);
	return AssembleSignedUrl(base, path, query_string, epoch,
				 signature, key_pair_id);
}

} // namespace CloudFront
