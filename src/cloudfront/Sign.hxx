// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/ossl_typ.h>

#include <cstddef>
#include <span>
#include <vector>

namespace CloudFront {

/**
 * Sign the policy document with RSASSA-PKCS1-v1_5 over its SHA-1
 * digest.
 *
 * Throws #SslError on (OpenSSL/libcrypto) error, including an
 * unusable random number generator; throws std::invalid_argument if
 * the key is not an RSA key.
 *
 * @return the raw signature (as many bytes as the RSA modulus)
 */
std::vector<std::byte>
SignPolicy(EVP_PKEY &key, std::span<const std::byte> policy);

} // namespace CloudFront
