// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Url.hxx"
#include "Error.hxx"
#include "uri/Chars.hxx"
#include "uri/Extract.hxx"
#include "uri/Verify.hxx"
#include "util/CharUtil.hxx"
#include "util/StringSplit.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

using std::string_view_literals::operator""sv;

namespace CloudFront {

static constexpr bool
IsForbiddenUrlChar(char ch) noexcept
{
	return IsWhitespaceOrNull(ch) || IsControlASCII(ch);
}

ParsedUrl
ParseBaseUrl(std::string_view url)
{
	if (std::any_of(url.begin(), url.end(), IsForbiddenUrlChar))
		throw MalformedUrlError{fmt::format("Illegal character in URL '{}'",
						    url)};

	ParsedUrl result;

	result.scheme = UriScheme(url);
	if (result.scheme.data() == nullptr)
		throw MalformedUrlError{fmt::format("Missing scheme in URL '{}'",
						    url)};

	result.authority = UriHostAndPort(url);
	if (result.authority.data() == nullptr ||
	    !VerifyUriAuthority(result.authority))
		throw MalformedUrlError{fmt::format("Malformed host in URL '{}'",
						    url)};

	const auto rest = UriPathQueryFragment(url);
	const auto [path_query, fragment] = Split(rest, '#');
	const auto [path, query] = Split(path_query, '?');

	result.path = path;
	result.query = query;
	result.fragment = fragment;
	return result;
}

std::string
EscapeUrlPath(std::string_view path)
{
	static constexpr char hex_digits[] = "0123456789ABCDEF";

	std::string result;
	result.reserve(path.size());

	for (std::size_t i = 0; i < path.size(); ++i) {
		const char ch = path[i];

		if (ch == '%'
		    ? (i + 2 < path.size() &&
		       IsHexDigit(path[i + 1]) && IsHexDigit(path[i + 2]))
		    : (IsUriPchar(ch) || ch == '/')) {
			result.push_back(ch);
		} else {
			const auto b = static_cast<unsigned char>(ch);
			result.push_back('%');
			result.push_back(hex_digits[b >> 4]);
			result.push_back(hex_digits[b & 0xf]);
		}
	}

	return result;
}

std::string
AssembleSignedUrl(const ParsedUrl &base, std::string_view path,
		  std::string_view query_string, int64_t expires,
		  std::string_view signature_b64,
		  std::string_view key_pair_id)
{
	std::string result;
	result.reserve(base.scheme.size() + 3 + base.authority.size() +
		       path.size() + query_string.size() +
		       signature_b64.size() + key_pair_id.size() + 64);

	/* the scheme is case-insensitive; emit the canonical form */
	std::transform(base.scheme.begin(), base.scheme.end(),
		       std::back_inserter(result), ToLowerASCII);
	result.append("://"sv);
	result.append(base.authority);

	if (!path.empty() && path.front() != '/')
		result.push_back('/');
	result.append(EscapeUrlPath(path));

	result.push_back('?');
	if (!query_string.empty()) {
		result.append(query_string);
		result.push_back('&');
	}

	fmt::format_to(std::back_inserter(result),
		       "Expires={}&Signature={}&Key-Pair-Id={}",
		       expires, signature_b64, key_pair_id);

	if (!base.fragment.empty()) {
		result.push_back('#');
		result.append(base.fragment);
	}

	return result;
}

} // namespace CloudFront
