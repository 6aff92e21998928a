// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

#include <stdexcept>

/**
 * Splits one line of a configuration file into tokens.  The line
 * buffer is modified in place: each token returned is
 * null-terminated.
 */
class LineParser {
	char *p;

public:
	class Error : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	explicit LineParser(char *_p) noexcept
		:p(StripLeft(_p))
	{
		StripRight(p);
	}

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	bool IsComment() const noexcept {
		return front() == '#';
	}

	void ExpectEnd();

	/**
	 * Parse a word consisting of letters, digits and underscores,
	 * followed by whitespace or the end of the line.
	 *
	 * @return the word or nullptr if there is none (the parser
	 * is unmodified then)
	 */
	const char *NextWord() noexcept;

	/**
	 * Parse a value which may be enclosed in single or double
	 * quotes.
	 *
	 * @return the value or nullptr on syntax error
	 */
	char *NextValue() noexcept;

	const char *ExpectWord();

	/**
	 * Parse "yes" or "no".
	 */
	bool ExpectBool();

	unsigned ExpectPositiveInteger();

	bool ExpectBoolAndEnd() {
		const bool value = ExpectBool();
		ExpectEnd();
		return value;
	}

	unsigned ExpectPositiveIntegerAndEnd() {
		const unsigned value = ExpectPositiveInteger();
		ExpectEnd();
		return value;
	}

private:
	void Strip() noexcept {
		p = StripLeft(p);
	}

	char *NextUnquotedValue() noexcept;
	char *NextQuotedValue(char quote) noexcept;

	static constexpr bool IsWordChar(char ch) noexcept {
		return IsAlphaNumericASCII(ch) || ch == '_';
	}

	static constexpr bool IsUnquotedChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':' ||
			ch == '/';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
