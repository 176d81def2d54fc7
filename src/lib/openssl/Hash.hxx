// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Calculate message digests with libcrypto.
 */

#pragma once

#include <openssl/sha.h>

#include <array>
#include <cstddef>
#include <span>

using SHA1Digest = std::array<std::byte, SHA_DIGEST_LENGTH>;

/**
 * Throws #SslError on error.
 */
SHA1Digest
CalcSHA1(std::span<const std::byte> src);
