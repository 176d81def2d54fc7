// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Policy.hxx"
#include "Error.hxx"

#include <boost/json/serialize.hpp>
#include <boost/json/string.hpp>

#include <fmt/format.h>

using std::string_view_literals::operator""sv;

namespace CloudFront {

/* the policy is a template with exactly two variables; these are
   the constant parts around them */
static constexpr std::string_view policy_before_resource =
	R"({"Statement":[{"Resource":)"sv;
static constexpr std::string_view policy_before_expires =
	R"(,"Condition":{"DateLessThan":{"AWS:EpochTime":)"sv;
static constexpr std::string_view policy_end = R"(}}}]})"sv;

int64_t
ToEpochSeconds(std::chrono::system_clock::time_point t) noexcept
{
	using namespace std::chrono;

	const auto ms = floor<milliseconds>(t.time_since_epoch());
	return floor<seconds>(ms).count();
}

/**
 * Check whether the given string is well-formed UTF-8 (no overlong
 * sequences, no surrogates, nothing beyond U+10FFFF).
 */
[[gnu::pure]]
static bool
ValidateUTF8(std::string_view s) noexcept
{
	auto p = reinterpret_cast<const unsigned char *>(s.data());
	const auto end = p + s.size();

	while (p < end) {
		const unsigned ch = *p++;
		if (ch < 0x80)
			continue;

		std::size_t n;
		unsigned min, cp;
		if ((ch & 0xe0) == 0xc0) {
			n = 1;
			min = 0x80;
			cp = ch & 0x1f;
		} else if ((ch & 0xf0) == 0xe0) {
			n = 2;
			min = 0x800;
			cp = ch & 0x0f;
		} else if ((ch & 0xf8) == 0xf0) {
			n = 3;
			min = 0x10000;
			cp = ch & 0x07;
		} else
			return false;

		if (std::size_t(end - p) < n)
			return false;

		for (std::size_t i = 0; i < n; ++i) {
			if ((p[i] & 0xc0) != 0x80)
				return false;

			cp = (cp << 6) | (p[i] & 0x3f);
		}

		p += n;

		if (cp < min || cp > 0x10ffff ||
		    (cp >= 0xd800 && cp <= 0xdfff))
			return false;
	}

	return true;
}

std::string
BuildPolicy(std::string_view resource,
	    std::chrono::system_clock::time_point expires)
{
	if (!ValidateUTF8(resource))
		throw PolicyError{"Resource is not valid UTF-8"};

	const auto resource_json =
		boost::json::serialize(boost::json::string{resource.data(),
							     resource.size()});

	std::string result;
	result.reserve(policy_before_resource.size() + resource_json.size() +
		       policy_before_expires.size() + 24 + policy_end.size());
	result.append(policy_before_resource);
	result.append(resource_json);
	result.append(policy_before_expires);
	result.append(fmt::format_int{ToEpochSeconds(expires)}.c_str());
	result.append(policy_end);
	return result;
}

} // namespace CloudFront
