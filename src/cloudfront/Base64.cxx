// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Base64.hxx"
#include "lib/sodium/Base64.hxx"
#include "util/SpanCast.hxx"

#include <algorithm>

namespace CloudFront {

struct Substitution {
	char original, safe;
};

static constexpr Substitution substitutions[] = {
	{ '+', '-' },
	{ '=', '_' },
	{ '/', '~' },
};

static constexpr char
ToSafe(char ch) noexcept
{
	for (const auto &i : substitutions)
		if (ch == i.original)
			return i.safe;

	return ch;
}

static constexpr char
FromSafe(char ch) noexcept
{
	for (const auto &i : substitutions)
		if (ch == i.safe)
			return i.original;

	return ch;
}

/**
 * Characters which never appear in UrlSafeBase64() output.
 */
static constexpr bool
IsOriginalOnly(char ch) noexcept
{
	return std::any_of(std::begin(substitutions), std::end(substitutions),
			   [ch](const auto &i){ return ch == i.original; });
}

std::string
UrlSafeBase64(std::span<const std::byte> src)
{
	auto result = SodiumBase64(src, sodium_base64_VARIANT_ORIGINAL);
	std::transform(result.begin(), result.end(), result.begin(), ToSafe);
	return result;
}

std::string
UrlSafeBase64(std::string_view src)
{
	return UrlSafeBase64(AsBytes(src));
}

std::optional<std::vector<std::byte>>
DecodeUrlSafeBase64(std::string_view src)
{
	if (std::any_of(src.begin(), src.end(), IsOriginalOnly))
		return std::nullopt;

	std::string b64{src};
	std::transform(b64.begin(), b64.end(), b64.begin(), FromSafe);
	return SodiumDecodeBase64(b64, sodium_base64_VARIANT_ORIGINAL);
}

} // namespace CloudFront
