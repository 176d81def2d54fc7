// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>
#include <utility>

/**
 * Split the string at the first occurrence of the given character.
 * If the character is not found, then the first value is the whole
 * string and the second value is nullptr.
 */
constexpr std::pair<std::string_view, std::string_view>
Split(const std::string_view haystack, const char ch) noexcept
{
	const auto i = haystack.find(ch);
	if (i == haystack.npos)
		return {haystack, {}};

	return {haystack.substr(0, i), haystack.substr(i + 1)};
}

/**
 * Like Split(), but split at the last occurrence of the given
 * character.
 */
constexpr std::pair<std::string_view, std::string_view>
SplitLast(const std::string_view haystack, const char ch) noexcept
{
	const auto i = haystack.rfind(ch);
	if (i == haystack.npos)
		return {haystack, {}};

	return {haystack.substr(0, i), haystack.substr(i + 1)};
}

/**
 * Like Split(), but split at the first character that matches the
 * given predicate; the separator character remains part of the
 * second value.
 */
template<typename P>
constexpr std::pair<std::string_view, std::string_view>
SplitBefore(const std::string_view haystack, P &&p) noexcept
{
	for (std::size_t i = 0; i < haystack.size(); ++i)
		if (p(haystack[i]))
			return {haystack.substr(0, i), haystack.substr(i)};

	return {haystack, {}};
}
