// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "StringSplit.hxx"

#include <concepts>
#include <string_view>

/**
 * Is the given string a non-empty list of items separated by the
 * given character, each of them accepted by the given function?
 * Empty items are passed to the function, too.
 */
[[gnu::pure]]
constexpr bool
IsNonEmptyListOf(std::string_view s, char separator,
		 std::predicate<std::string_view> auto f) noexcept
{
	if (s.empty())
		return false;

	while (true) {
		const auto [item, rest] = Split(s, separator);
		if (!f(item))
			return false;

		if (rest.data() == nullptr)
			return true;

		s = rest;
	}
}
