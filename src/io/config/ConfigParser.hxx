// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <filesystem>

class LineParser;

/**
 * Receives the lines of a configuration file.
 */
class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Gets called before ParseLine(); returns true if the line
	 * was consumed and shall not be passed to ParseLine().
	 */
	virtual bool PreParseLine(LineParser &line);
	virtual void ParseLine(LineParser &line) = 0;

	/**
	 * The end of the file was reached.  May throw if the
	 * configuration is incomplete.
	 */
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores lines starting with '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child)
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) final;
	void Finish() override;
};

/**
 * Parse the given file line by line and feed each line into the
 * given #ConfigParser, and call ConfigParser::Finish() at the end.
 *
 * Errors are rethrown nested inside a #LineParser::Error which
 * describes the file name and line number.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
