// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

namespace CloudFront {

/**
 * The policy document could not be serialized.
 */
class PolicyError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The configured base URL could not be parsed.
 */
class MalformedUrlError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

} // namespace CloudFront
