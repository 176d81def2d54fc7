// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/config/ConfigParser.hxx"

#include <chrono>
#include <filesystem>
#include <string>

namespace CloudFront {

class Signer;

struct Config {
	std::string base_url;

	std::string key_pair_id;

	/**
	 * Path of the PEM-encoded RSA private key.
	 */
	std::filesystem::path private_key;

	/**
	 * How long grants issued by the command-line tool are valid.
	 */
	std::chrono::seconds lifetime{3600};
};

/**
 * Parses the lines of a configuration file into a #Config.  Wrap it
 * in a #CommentConfigParser to allow comments and blank lines.
 */
class ConfigFileParser final : public ConfigParser {
	Config &config;

	/**
	 * Relative paths are resolved in this directory.
	 */
	const std::filesystem::path base_directory;

	bool have_lifetime = false;

public:
	/**
	 * @param config_path the path of the file being parsed
	 */
	ConfigFileParser(Config &_config,
			 const std::filesystem::path &config_path)
		:config(_config), base_directory(config_path.parent_path()) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * Load the configuration file.
 *
 * Throws on error.
 */
Config
LoadConfig(const std::filesystem::path &path);

/**
 * Load the private key and create a #Signer.
 *
 * Throws on error.
 */
Signer
MakeSigner(const Config &config);

} // namespace CloudFront
