// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Sign.hxx"
#include "lib/openssl/AllocateSign.hxx"
#include "lib/openssl/Error.hxx"
#include "lib/openssl/Hash.hxx"
#include "lib/openssl/Key.hxx"
#include "lib/openssl/UniqueEVP.hxx"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

#include <stdexcept>

namespace CloudFront {

std::vector<std::byte>
SignPolicy(EVP_PKEY &key, std::span<const std::byte> policy)
{
	if (!IsRsaKey(key))
		throw std::invalid_argument{"RSA key expected"};

	ERR_clear_error();

	/* RSA blinding draws from the CSPRNG */
	if (RAND_status() != 1)
		throw SslError("Random number generator is not seeded");

	const auto digest = CalcSHA1(policy);

	UniqueEVP_PKEY_CTX ctx(EVP_PKEY_CTX_new(&key, nullptr));
	if (!ctx)
		throw SslError("EVP_PKEY_CTX_new() failed");

	if (EVP_PKEY_sign_init(ctx.get()) <= 0)
		throw SslError("EVP_PKEY_sign_init() failed");

	if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0)
		throw SslError("EVP_PKEY_CTX_set_rsa_padding() failed");

	if (EVP_PKEY_CTX_set_signature_md(ctx.get(), EVP_sha1()) <= 0)
		throw SslError("EVP_PKEY_CTX_set_signature_md() failed");

	return EVP_PKEY_sign(*ctx, digest);
}

} // namespace CloudFront
