// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"

#include <fmt/core.h>

#include <stdlib.h>
#include <string.h>

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error{fmt::format("Unexpected tokens at end of line: {:?}", p)};
}

const char *
LineParser::NextWord() noexcept
{
	char *end = p;
	while (IsWordChar(*end))
		++end;

	if (end == p)
		return nullptr;

	char *const word = p;
	if (*end == 0) {
		p = end;
	} else if (IsWhitespaceNotNull(*end)) {
		*end = 0;
		p = StripLeft(end + 1);
	} else
		/* not followed by a word boundary */
		return nullptr;

	return word;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *end = p;
	while (IsUnquotedChar(*end))
		++end;

	char *const value = p;
	if (*end == 0) {
		p = end;
	} else if (IsWhitespaceNotNull(*end)) {
		*end = 0;
		p = StripLeft(end + 1);
	} else
		return nullptr;

	return value;
}

inline char *
LineParser::NextQuotedValue(const char quote) noexcept
{
	char *const value = p + 1;
	char *const end = strchr(value, quote);
	if (end == nullptr)
		/* unterminated */
		return nullptr;

	*end = 0;
	p = end + 1;
	Strip();
	return value;
}

char *
LineParser::NextValue() noexcept
{
	if (IsQuote(front()))
		return NextQuotedValue(front());
	else if (IsUnquotedChar(front()))
		return NextUnquotedValue();
	else
		return nullptr;
}

const char *
LineParser::ExpectWord()
{
	const char *word = NextWord();
	if (word == nullptr)
		throw Error{"Option name expected"};

	return word;
}

bool
LineParser::ExpectBool()
{
	const char *value = NextValue();
	if (value != nullptr) {
		if (strcmp(value, "yes") == 0)
			return true;

		if (strcmp(value, "no") == 0)
			return false;
	}

	throw Error{"\"yes\" or \"no\" expected"};
}

unsigned
LineParser::ExpectPositiveInteger()
{
	const char *value = NextValue();
	if (value == nullptr || !IsDigitASCII(*value))
		throw Error{"Positive integer expected"};

	char *endptr;
	const unsigned long l = strtoul(value, &endptr, 10);
	if (*endptr != 0)
		throw Error{"Positive integer expected"};

	if (l == 0)
		throw Error{"Zero is not allowed"};

	if (l > 0xffffffffUL)
		throw Error{"Number is too large"};

	return (unsigned)l;
}
