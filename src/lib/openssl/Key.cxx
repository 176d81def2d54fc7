// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Key.hxx"
#include "Error.hxx"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <memory>
#include <string>

struct BIODeleter {
	void operator()(BIO *bio) noexcept {
		BIO_free(bio);
	}
};

using UniqueBIO = std::unique_ptr<BIO, BIODeleter>;

UniqueEVP_PKEY
GenerateRsaKey(unsigned bits)
{
	const UniqueEVP_PKEY_CTX ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
	if (!ctx)
		throw SslError("EVP_PKEY_CTX_new_id() failed");

	if (EVP_PKEY_keygen_init(ctx.get()) <= 0)
		throw SslError("EVP_PKEY_keygen_init() failed");

	if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0)
		throw SslError("EVP_PKEY_CTX_set_rsa_keygen_bits() failed");

	EVP_PKEY *pkey = nullptr;
	if (EVP_PKEY_keygen(ctx.get(), &pkey) <= 0)
		throw SslError("EVP_PKEY_keygen() failed");

	return UniqueEVP_PKEY(pkey);
}

static UniqueEVP_PKEY
ReadPemKey(BIO &bio, const char *what)
{
	UniqueEVP_PKEY key(PEM_read_bio_PrivateKey(&bio, nullptr,
						   nullptr, nullptr));
	if (!key)
		throw SslError(std::string("Failed to read private key from ") + what);

	return key;
}

UniqueEVP_PKEY
LoadKeyFile(const char *path)
{
	ERR_clear_error();

	UniqueBIO bio(BIO_new_file(path, "r"));
	if (!bio)
		throw SslError(std::string("Failed to open ") + path);

	return ReadPemKey(*bio, path);
}

bool
IsRsaKey(const EVP_PKEY &key) noexcept
{
	return EVP_PKEY_get_base_id(&key) == EVP_PKEY_RSA;
}
