// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "Signer.hxx"
#include "io/Logger.hxx"
#include "io/config/LineParser.hxx"
#include "lib/openssl/Key.hxx"

#include <fmt/core.h>

#include <utility>

#include <string.h>

namespace CloudFront {

static const char *
ExpectStringAndEnd(LineParser &line)
{
	const char *value = line.NextUnescape();
	if (value == nullptr || *value == 0)
		throw LineParser::Error("Quoted value expected");

	line.ExpectEnd();
	return value;
}

/**
 * Parse a (quoted) path; a relative path is resolved in the given
 * directory.
 */
static std::filesystem::path
ExpectPathAndEnd(LineParser &line,
		 const std::filesystem::path &base_directory)
{
	std::filesystem::path path = ExpectStringAndEnd(line);
	if (path.is_relative())
		path = base_directory / path;
	return path;
}

static void
SetOnce(std::string &dest, const char *name, const char *value)
{
	if (!dest.empty())
		throw LineParser::Error(fmt::format("Duplicate '{}'", name));

	dest = value;
}

void
ConfigFileParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "base_url") == 0) {
		SetOnce(config.base_url, word, ExpectStringAndEnd(line));
	} else if (strcmp(word, "key_pair_id") == 0) {
		SetOnce(config.key_pair_id, word, ExpectStringAndEnd(line));
	} else if (strcmp(word, "private_key") == 0) {
		if (!config.private_key.empty())
			throw LineParser::Error("Duplicate 'private_key'");

		config.private_key = ExpectPathAndEnd(line, base_directory);
	} else if (strcmp(word, "lifetime") == 0) {
		if (have_lifetime)
			throw LineParser::Error("Duplicate 'lifetime'");

		config.lifetime = std::chrono::seconds{line.NextPositiveInteger()};
		line.ExpectEnd();
		have_lifetime = true;
	} else
		throw LineParser::Error(fmt::format("Unknown option '{}'", word));
}

void
ConfigFileParser::Finish()
{
	if (config.base_url.empty())
		throw LineParser::Error("Missing 'base_url'");

	if (config.key_pair_id.empty())
		throw LineParser::Error("Missing 'key_pair_id'");

	if (config.private_key.empty())
		throw LineParser::Error("Missing 'private_key'");

	ConfigParser::Finish();
}

Config
LoadConfig(const std::filesystem::path &path)
{
	Config config;
	ConfigFileParser parser{config, path};
	CommentConfigParser comment_parser{parser};
	ParseConfigFile(path, comment_parser);

	LogFmt(4, "cloudfront", "Loaded {}: base_url='{}' key_pair_id='{}'",
	       path.native(), config.base_url, config.key_pair_id);
	return config;
}

Signer
MakeSigner(const Config &config)
{
	auto key = LoadKeyFile(config.private_key.c_str());
	return {config.base_url, config.key_pair_id, std::move(key)};
}

} // namespace CloudFront
