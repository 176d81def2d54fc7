// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "cloudfront/Base64.hxx"
#include "cloudfront/Policy.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>

using std::string_view_literals::operator""sv;

TEST(CloudFrontBase64, Empty)
{
	EXPECT_EQ(CloudFront::UrlSafeBase64(""sv), "");

	const auto decoded = CloudFront::DecodeUrlSafeBase64(""sv);
	ASSERT_TRUE(decoded);
	EXPECT_TRUE(decoded->empty());
}

TEST(CloudFrontBase64, Padding)
{
	EXPECT_EQ(CloudFront::UrlSafeBase64("f"sv), "Zg__");
	EXPECT_EQ(CloudFront::UrlSafeBase64("fo"sv), "Zm8_");
	EXPECT_EQ(CloudFront::UrlSafeBase64("foo"sv), "Zm9v");
	EXPECT_EQ(CloudFront::UrlSafeBase64("foob"sv), "Zm9vYg__");
}

TEST(CloudFrontBase64, Substitution)
{
	/* standard base64 of these bytes is "+/8=" */
	static constexpr std::array<std::byte, 2> data{std::byte{0xfb}, std::byte{0xff}};
	EXPECT_EQ(CloudFront::UrlSafeBase64(data), "-~8_");

	const auto decoded = CloudFront::DecodeUrlSafeBase64("-~8_"sv);
	ASSERT_TRUE(decoded);
	ASSERT_EQ(decoded->size(), data.size());
	EXPECT_TRUE(std::equal(decoded->begin(), decoded->end(), data.begin()));
}

TEST(CloudFrontBase64, AllBytes)
{
	std::array<std::byte, 256> data;
	for (std::size_t i = 0; i < data.size(); ++i)
		data[i] = static_cast<std::byte>(i);

	const auto encoded = CloudFront::UrlSafeBase64(data);
	EXPECT_EQ(encoded.find_first_of("+/="), encoded.npos);

	const auto decoded = CloudFront::DecodeUrlSafeBase64(encoded);
	ASSERT_TRUE(decoded);
	ASSERT_EQ(decoded->size(), data.size());
	EXPECT_TRUE(std::equal(decoded->begin(), decoded->end(), data.begin()));
}

TEST(CloudFrontBase64, Policy)
{
	const auto policy =
		CloudFront::BuildPolicy("https://cdn.example.com/images/1.jpg"sv,
					std::chrono::system_clock::from_time_t(1700000000));

	const auto encoded = CloudFront::UrlSafeBase64(policy);
	EXPECT_EQ(encoded.find_first_of("+/="), encoded.npos);

	const auto decoded = CloudFront::DecodeUrlSafeBase64(encoded);
	ASSERT_TRUE(decoded);
	EXPECT_EQ(ToStringView(*decoded), policy);
}

TEST(CloudFrontBase64, Malformed)
{
	/* characters of the standard alphabet are not accepted */
	EXPECT_FALSE(CloudFront::DecodeUrlSafeBase64("+/8="sv));
	EXPECT_FALSE(CloudFront::DecodeUrlSafeBase64("Zg=="sv));

	/* incomplete padding */
	EXPECT_FALSE(CloudFront::DecodeUrlSafeBase64("Zg_"sv));
	EXPECT_FALSE(CloudFront::DecodeUrlSafeBase64("Zg"sv));

	/* garbage */
	EXPECT_FALSE(CloudFront::DecodeUrlSafeBase64("Zm9v!"sv));
	EXPECT_FALSE(CloudFront::DecodeUrlSafeBase64("Zm9v Zm9v"sv));
}
