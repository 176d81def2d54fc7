// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Canned policy documents.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace CloudFront {

/**
 * Convert the expiry to Unix seconds the way the delivery network
 * expects it: truncate to millisecond precision, then round down to
 * whole seconds.
 */
[[gnu::const]]
int64_t
ToEpochSeconds(std::chrono::system_clock::time_point t) noexcept;

/**
 * Build the canned policy for the given resource:
 *
 * {"Statement":[{"Resource":"...","Condition":{"DateLessThan":{"AWS:EpochTime":...}}}]}
 *
 * The output is byte-for-byte deterministic: field order, spelling
 * and (absence of) whitespace are fixed, because the verifying side
 * reconstructs this exact document.
 *
 * Throws #PolicyError if the resource cannot be represented as a
 * JSON string (i.e. it is not valid UTF-8).
 */
std::string
BuildPolicy(std::string_view resource,
	    std::chrono::system_clock::time_point expires);

} // namespace CloudFront
