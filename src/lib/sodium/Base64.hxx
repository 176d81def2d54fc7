// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <sodium/utils.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

static inline int
sodium_base642bin(std::span<std::byte> bin,
		  std::string_view b64,
		  const char *ignore,
		  std::size_t *bin_len,
		  const char **b64_end, int variant) noexcept
{
	return sodium_base642bin(reinterpret_cast<unsigned char *>(bin.data()), bin.size(),
				 b64.data(), b64.size(),
				 ignore, bin_len,
				 b64_end, variant);
}

/**
 * Encode binary data with base64.
 *
 * @param variant one of the sodium_base64_VARIANT_* constants
 */
std::string
SodiumBase64(std::span<const std::byte> src, int variant);

/**
 * Decode a base64 string.  Unlike sodium_base642bin(), this rejects
 * unparsed garbage at the end of the input.
 *
 * @param variant one of the sodium_base64_VARIANT_* constants
 * @return the decoded data or std::nullopt on error
 */
std::optional<std::vector<std::byte>>
SodiumDecodeBase64(std::string_view src, int variant);
