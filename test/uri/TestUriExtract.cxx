// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "uri/Extract.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static constexpr struct UriTests {
	const char *uri;
	const char *scheme;
	const char *host_and_port;
	const char *path;
} uri_tests[] = {
	{ "http://foo/bar", "http", "foo", "/bar" },
	{ "https://foo/bar", "https", "foo", "/bar" },
	{ "http://foo:8080/bar", "http", "foo:8080", "/bar" },
	{ "http://foo", "http", "foo", nullptr },
	{ "http://foo/bar?a=b", "http", "foo", "/bar?a=b" },
	{ "http://foo?a=b", "http", "foo", "?a=b" },
	{ "http://foo#top", "http", "foo", "#top" },
	{ "whatever-scheme://foo/bar?a=b", "whatever-scheme", "foo", "/bar?a=b" },
	{ "//foo/bar", nullptr, "foo", "/bar" },
	{ "//foo", nullptr, "foo", nullptr },
	{ "/bar?a=b", nullptr, nullptr, "/bar?a=b" },
	{ "bar?a=b", nullptr, nullptr, "bar?a=b" },
	{ "Http://foo/bar", "Http", "foo", "/bar" },
	{ "HTTPS://foo/bar", "HTTPS", "foo", "/bar" },
	{ "1http://foo/bar", nullptr, nullptr, "1http://foo/bar" },
	{ "http:///bar", "http", nullptr, "http:///bar" },
};

static void
ExpectView(std::string_view result, const char *expected)
{
	if (expected == nullptr)
		EXPECT_EQ(result.data(), nullptr);
	else
		EXPECT_EQ(result, std::string_view{expected});
}

TEST(UriExtractTest, Scheme)
{
	for (const auto &i : uri_tests)
		ExpectView(UriScheme(i.uri), i.scheme);
}

TEST(UriExtractTest, HostAndPort)
{
	for (const auto &i : uri_tests)
		ExpectView(UriHostAndPort(i.uri), i.host_and_port);
}

TEST(UriExtractTest, Path)
{
	for (const auto &i : uri_tests)
		ExpectView(UriPathQueryFragment(i.uri), i.path);
}

TEST(UriExtractTest, AfterScheme)
{
	EXPECT_EQ(UriAfterScheme("https://foo/bar"sv), "foo/bar"sv);
	EXPECT_EQ(UriAfterScheme("//foo/bar"sv), "foo/bar"sv);
	EXPECT_EQ(UriAfterScheme("/foo/bar"sv).data(), nullptr);
	EXPECT_EQ(UriAfterScheme("mailto:foo@example.com"sv).data(), nullptr);
}
