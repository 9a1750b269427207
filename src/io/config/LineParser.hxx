// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/StringStrip.hxx"
#include "util/CharUtil.hxx"

#include <stdexcept>

/**
 * A tokenizer for one line of a configuration file.  It modifies the
 * line buffer in place (null-terminating the tokens it returns).
 */
class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	explicit LineParser(char *_p) noexcept
		:p(StripLeft(_p))
	{
		StripRight(p);
	}

	void Strip() noexcept {
		p = StripLeft(p);
	}

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	void ExpectEnd();

	/**
	 * If the next word matches the given parameter, then skip it and
	 * return true.  If not, the method returns false, leaving the
	 * object unmodified.
	 */
	bool SkipWord(const char *word) noexcept;

	const char *NextWord() noexcept;
	char *NextValue() noexcept;

	/**
	 * Like NextValue(), but double-quoted values may contain
	 * backslash escapes.
	 */
	char *NextUnescape() noexcept;

	/**
	 * Parse "yes" or "no".
	 */
	bool NextBool();

	const char *ExpectWord();

	/**
	 * Expect a non-empty value.
	 */
	char *ExpectValue();

	/**
	 * Expect a non-empty value and end-of-line.
	 */
	char *ExpectValueAndEnd();

	static constexpr bool IsWordChar(char ch) noexcept {
		return IsAlphaNumericASCII(ch) || ch == '_';
	}

private:
	char *NextUnquotedValue() noexcept;
	char *NextQuotedValue(char stop) noexcept;

	static constexpr bool IsUnquotedChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':' ||
			ch == '/';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
