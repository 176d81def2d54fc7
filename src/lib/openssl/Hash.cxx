// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Hash.hxx"
#include "Error.hxx"

#include <openssl/evp.h>

SHA1Digest
CalcSHA1(std::span<const std::byte> src)
{
	SHA1Digest result;
	if (!EVP_Digest(src.data(), src.size(),
			reinterpret_cast<unsigned char *>(result.data()), nullptr,
			EVP_sha1(), nullptr))
		throw SslError("EVP_Digest() failed");

	return result;
}
