// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TestKey.hxx"
#include "cloudfront/Sign.hxx"
#include "cloudfront/Policy.hxx"
#include "lib/openssl/UniqueEVP.hxx"

#include <gtest/gtest.h>

#include <openssl/ec.h>
#include <openssl/evp.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

TEST(CloudFrontSign, Verify)
{
	auto &key = GetTestKey();

	const auto policy =
		CloudFront::BuildPolicy("https://cdn.example.com/images/1.jpg"sv,
					std::chrono::system_clock::from_time_t(1700000000));

	const auto signature = CloudFront::SignPolicy(key, AsBytes(policy));
	EXPECT_EQ(signature.size(), std::size_t(EVP_PKEY_get_size(&key)));
	EXPECT_TRUE(VerifySignature(key, policy, signature));

	/* the signature must not be valid for any other document */
	auto other = policy;
	other.back() = ' ';
	EXPECT_FALSE(VerifySignature(key, other, signature));
}

TEST(CloudFrontSign, Empty)
{
	auto &key = GetTestKey();

	const auto signature = CloudFront::SignPolicy(key, {});
	EXPECT_TRUE(VerifySignature(key, ""sv, signature));
}

TEST(CloudFrontSign, OtherKey)
{
	const auto policy = CloudFront::BuildPolicy("/x"sv, {});
	const auto signature = CloudFront::SignPolicy(GetTestKey(), AsBytes(policy));

	const auto other_key = GenerateRsaKey(2048);
	EXPECT_FALSE(VerifySignature(*other_key, policy, signature));
}

TEST(CloudFrontSign, NotRSA)
{
	const UniqueEVP_PKEY ec_key{EVP_EC_gen("P-256")};
	ASSERT_TRUE(ec_key);

	EXPECT_THROW(CloudFront::SignPolicy(*ec_key, AsBytes("x"sv)),
		     std::invalid_argument);
}
