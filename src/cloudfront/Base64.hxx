// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace CloudFront {

/**
 * Encode with standard (padded) base64 and then substitute the three
 * characters which are unsafe in query strings and cookies:
 *
 *   '+' -> '-'
 *   '=' -> '_'
 *   '/' -> '~'
 *
 * Note this is not the RFC 4648 "base64url" alphabet.
 */
std::string
UrlSafeBase64(std::span<const std::byte> src);

std::string
UrlSafeBase64(std::string_view src);

/**
 * The inverse of UrlSafeBase64().
 *
 * @return the decoded data or std::nullopt if the input is malformed
 */
std::optional<std::vector<std::byte>>
DecodeUrlSafeBase64(std::string_view src);

} // namespace CloudFront
