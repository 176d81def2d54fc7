// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * OpenSSL key utilities.
 */

#pragma once

#include "UniqueEVP.hxx"

/**
 * Generate a new RSA key.
 *
 * Throws #SslError on error.
 */
UniqueEVP_PKEY
GenerateRsaKey(unsigned bits=2048);

/**
 * Load a PEM-encoded private key from a file.
 *
 * Throws #SslError on error.
 */
UniqueEVP_PKEY
LoadKeyFile(const char *path);

[[gnu::pure]]
bool
IsRsaKey(const EVP_PKEY &key) noexcept;
