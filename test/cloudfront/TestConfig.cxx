// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TestKey.hxx"
#include "cloudfront/Config.hxx"
#include "cloudfront/Signer.hxx"
#include "io/config/LineParser.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <openssl/pem.h>

#include <fstream>
#include <initializer_list>
#include <memory>
#include <string>

#include <stdio.h>
#include <unistd.h>

namespace fs = std::filesystem;

/**
 * Feed the given lines into a #ConfigFileParser, the way
 * ParseConfigFile() does.
 */
static CloudFront::Config
ParseLines(std::initializer_list<const char *> lines)
{
	static const fs::path config_path{"/etc/cf-sign/cf-sign.conf"};

	CloudFront::Config config;
	CloudFront::ConfigFileParser parser{config, config_path};
	CommentConfigParser comment_parser{parser};

	for (const char *i : lines) {
		std::string buffer{i};
		LineParser line{buffer.data()};
		if (!comment_parser.PreParseLine(line))
			comment_parser.ParseLine(line);
	}

	comment_parser.Finish();
	return config;
}

TEST(CloudFrontConfig, Parse)
{
	const auto config = ParseLines({
		"# the distribution",
		"base_url \"https://cdn.example.com/\"",
		"",
		"  key_pair_id K2JCJMDEHXQW5F  ",
		"private_key \"keys/cf.pem\"",
	});

	EXPECT_EQ(config.base_url, "https://cdn.example.com/");
	EXPECT_EQ(config.key_pair_id, "K2JCJMDEHXQW5F");
	EXPECT_EQ(config.private_key, fs::path{"/etc/cf-sign/keys/cf.pem"});
	EXPECT_EQ(config.lifetime, std::chrono::seconds{3600});
}

TEST(CloudFrontConfig, AbsolutePathAndLifetime)
{
	const auto config = ParseLines({
		"base_url 'https://cdn.example.com/a\\b'",
		"key_pair_id \"K\\t1\"",
		"private_key \"/var/lib/cf.pem\"",
		"lifetime 60",
	});

	/* single quotes are literal, double quotes resolve escapes */
	EXPECT_EQ(config.base_url, "https://cdn.example.com/a\\b");
	EXPECT_EQ(config.key_pair_id, "K\t1");
	EXPECT_EQ(config.private_key, fs::path{"/var/lib/cf.pem"});
	EXPECT_EQ(config.lifetime, std::chrono::seconds{60});
}

TEST(CloudFrontConfig, RelativePath)
{
	const auto config = ParseLines({
		"base_url \"https://cdn.example.com/\"",
		"key_pair_id K",
		"private_key '../keys/cf.pem'",
	});

	EXPECT_EQ(config.private_key, fs::path{"/etc/cf-sign/../keys/cf.pem"});

	const auto bare = ParseLines({
		"base_url \"https://cdn.example.com/\"",
		"key_pair_id K",
		"private_key cf.pem",
	});

	EXPECT_EQ(bare.private_key, fs::path{"/etc/cf-sign/cf.pem"});
}

TEST(CloudFrontConfig, Errors)
{
	/* missing keys */
	EXPECT_THROW(ParseLines({}), std::runtime_error);
	EXPECT_THROW(ParseLines({
				"base_url \"https://cdn.example.com/\"",
				"key_pair_id K",
			}), std::runtime_error);

	/* duplicate keys */
	EXPECT_THROW(ParseLines({
				"base_url \"https://cdn.example.com/\"",
				"base_url \"https://cdn.example.com/\"",
			}), std::runtime_error);
	EXPECT_THROW(ParseLines({
				"lifetime 1",
				"lifetime 1",
			}), std::runtime_error);

	/* unknown key */
	EXPECT_THROW(ParseLines({"foo bar"}), std::runtime_error);

	/* bad values */
	EXPECT_THROW(ParseLines({"lifetime 0"}), std::runtime_error);
	EXPECT_THROW(ParseLines({"lifetime -1"}), std::runtime_error);
	EXPECT_THROW(ParseLines({"lifetime 1h"}), std::runtime_error);
	EXPECT_THROW(ParseLines({"key_pair_id \"\""}), std::runtime_error);
	EXPECT_THROW(ParseLines({"private_key \"\""}), std::runtime_error);
	EXPECT_THROW(ParseLines({"private_key \"a.pem\" b"}), std::runtime_error);
	EXPECT_THROW(ParseLines({"key_pair_id \"K"}), std::runtime_error);
	EXPECT_THROW(ParseLines({"key_pair_id K L"}), std::runtime_error);
	EXPECT_THROW(ParseLines({"base_url https://cdn.example.com/"}), std::runtime_error);
}

/**
 * A temporary directory which is deleted with all its contents in
 * the destructor.
 */
class TempDirectory {
	fs::path path;

public:
	TempDirectory()
		:path(fs::temp_directory_path() /
		      ("TestCloudFrontConfig." + std::to_string(getpid())))
	{
		fs::create_directories(path);
	}

	~TempDirectory() noexcept {
		std::error_code ec;
		fs::remove_all(path, ec);
	}

	const fs::path &GetPath() const noexcept {
		return path;
	}

	void WriteFile(const char *name, std::string_view contents) const {
		std::ofstream file{path / name};
		file << contents;
	}
};

struct StdioFileDeleter {
	void operator()(FILE *file) const noexcept {
		fclose(file);
	}
};

static void
WritePemKey(const fs::path &path, EVP_PKEY &key)
{
	const std::unique_ptr<FILE, StdioFileDeleter> file{fopen(path.c_str(), "w")};
	ASSERT_TRUE(file);
	ASSERT_EQ(PEM_write_PrivateKey(file.get(), &key, nullptr, nullptr, 0,
				       nullptr, nullptr), 1);
}

TEST(CloudFrontConfig, Load)
{
	const TempDirectory dir;
	WritePemKey(dir.GetPath() / "cf.pem", GetTestKey());
	dir.WriteFile("cf-sign.conf",
		      "# test\n"
		      "base_url \"https://cdn.example.com/\"\n"
		      "key_pair_id K2JCJMDEHXQW5F\n"
		      "private_key \"cf.pem\"\n"
		      "lifetime 300\n");

	const auto config = CloudFront::LoadConfig(dir.GetPath() / "cf-sign.conf");
	EXPECT_EQ(config.base_url, "https://cdn.example.com/");
	EXPECT_EQ(config.key_pair_id, "K2JCJMDEHXQW5F");
	EXPECT_EQ(config.private_key, dir.GetPath() / "cf.pem");
	EXPECT_EQ(config.lifetime, std::chrono::seconds{300});

	const auto signer = CloudFront::MakeSigner(config);
	EXPECT_EQ(signer.GetBaseUrl(), "https://cdn.example.com/");
	EXPECT_EQ(signer.GetKeyPairId(), "K2JCJMDEHXQW5F");

	const auto url = signer.CannedSignedUrl("/a", {},
						std::chrono::system_clock::now());
	EXPECT_TRUE(url.starts_with("https://cdn.example.com/a?Expires="));
}

TEST(CloudFrontConfig, LoadErrors)
{
	const TempDirectory dir;

	/* file does not exist */
	EXPECT_THROW(CloudFront::LoadConfig(dir.GetPath() / "missing.conf"),
		     std::system_error);

	/* the line number is part of the message */
	dir.WriteFile("bad.conf",
		      "base_url \"https://cdn.example.com/\"\n"
		      "\n"
		      "foo bar\n");
	try {
		CloudFront::LoadConfig(dir.GetPath() / "bad.conf");
		FAIL();
	} catch (...) {
		const auto msg = GetFullMessage(std::current_exception());
		EXPECT_NE(msg.find("bad.conf:3; "), msg.npos) << msg;
		EXPECT_NE(msg.find("Unknown option 'foo'"), msg.npos) << msg;
	}

	/* incomplete */
	dir.WriteFile("incomplete.conf",
		      "base_url \"https://cdn.example.com/\"\n");
	try {
		CloudFront::LoadConfig(dir.GetPath() / "incomplete.conf");
		FAIL();
	} catch (...) {
		const auto msg = GetFullMessage(std::current_exception());
		EXPECT_NE(msg.find("Missing 'key_pair_id'"), msg.npos) << msg;
	}

	/* key file does not exist */
	dir.WriteFile("nokey.conf",
		      "base_url \"https://cdn.example.com/\"\n"
		      "key_pair_id K\n"
		      "private_key \"missing.pem\"\n");
	const auto config = CloudFront::LoadConfig(dir.GetPath() / "nokey.conf");
	EXPECT_THROW(CloudFront::MakeSigner(config), std::runtime_error);

	/* not a key */
	dir.WriteFile("garbage.pem", "garbage\n");
	auto config2 = config;
	config2.private_key = dir.GetPath() / "garbage.pem";
	EXPECT_THROW(CloudFront::MakeSigner(config2), std::runtime_error);
}
