// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "system/Error.hxx"

#include <fmt/core.h>

#include <exception>
#include <memory>

#include <stdio.h>
#include <stdlib.h>

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

struct FileDeleter {
	void operator()(FILE *file) const noexcept {
		fclose(file);
	}
};

/**
 * A line buffer for getline() which frees itself.
 */
class LineReader {
	FILE &file;

	char *buffer = nullptr;
	size_t capacity = 0;

public:
	explicit LineReader(FILE &_file) noexcept
		:file(_file) {}

	~LineReader() noexcept {
		free(buffer);
	}

	LineReader(const LineReader &) = delete;
	LineReader &operator=(const LineReader &) = delete;

	/**
	 * @return the next line (including the newline character) or
	 * nullptr on end of file or error
	 */
	char *ReadLine() noexcept {
		return getline(&buffer, &capacity, &file) >= 0
			? buffer
			: nullptr;
	}
};

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	const std::unique_ptr<FILE, FileDeleter> file{fopen(path.c_str(), "r")};
	if (!file)
		throw MakeErrno(fmt::format("Failed to open {}",
					    path.native()).c_str());

	LineReader reader{*file};

	unsigned i = 1;
	while (char *line = reader.ReadLine()) {
		LineParser line_parser(line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}",
									     path.native(), i)});
		}

		++i;
	}

	if (ferror(file.get()))
		throw MakeErrno(fmt::format("Failed to read {}",
					    path.native()).c_str());

	try {
		parser.Finish();
	} catch (...) {
		std::throw_with_nested(LineParser::Error{path.native()});
	}
}
