// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineParser.hxx"

#include <fmt/core.h>

#include <stdlib.h>
#include <string.h>

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error(fmt::format("Unexpected tokens at end of line: {}",
					p));
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	if (!IsUnquotedChar(front()))
		return nullptr;

	char *result = p;
	do {
		++p;
	} while (IsUnquotedChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *const value = p + 1;
	char *const end = strchr(value, stop);
	if (end == nullptr)
		return nullptr;

	*end = 0;
	p = end + 1;
	Strip();

	return value;
}

inline char *
LineParser::NextUnescapedQuotedValue() noexcept
{
	char *const value = ++p;
	char *dest = value;

	while (true) {
		char ch = *p++;

		switch (ch) {
		case 0:
			return nullptr;

		case '"':
			*dest = 0;
			Strip();
			return value;

		case '\\':
			ch = *p++;
			switch (ch) {
			case 0:
				return nullptr;

			case 'n':
				ch = '\n';
				break;

			case 'r':
				ch = '\r';
				break;

			case 't':
				ch = '\t';
				break;
			}

			*dest++ = ch;
			break;

		default:
			*dest++ = ch;
		}
	}
}

char *
LineParser::NextValue() noexcept
{
	const char ch = front();
	if (IsQuote(ch))
		return NextQuotedValue(ch);
	else
		return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	switch (front()) {
	case '"':
		return NextUnescapedQuotedValue();

	case '\'':
		return NextQuotedValue('\'');

	default:
		return NextUnquotedValue();
	}
}

unsigned
LineParser::NextPositiveInteger()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("Positive integer expected");

	char *endptr;
	unsigned long l = strtoul(value, &endptr, 10);
	if (endptr == value || *endptr != 0 || l == 0 || l > 0xffffffffUL)
		throw Error("Positive integer expected");

	return (unsigned)l;
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}
