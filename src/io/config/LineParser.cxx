// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"

#include <fmt/format.h>

#include <string.h>

using std::string_view_literals::operator""sv;

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error{fmt::format("Unexpected tokens at end of line: {}"sv, p)};
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	char *q = p;
	while (*word != 0)
		if (*q++ != *word++)
			return false;

	if (*q != 0 && !IsWhitespaceNotNull(*q))
		return false;

	p = StripLeft(q);
	return true;
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
	char *result = p;
	while (IsUnquotedChar(front()))
		++p;

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
	char *value = p;
	char *q = strchr(p, stop);
	if (q == nullptr)
		return nullptr;

	*q++ = 0;
	p = StripLeft(q);
	return value;
}

char *
LineParser::NextValue() noexcept
{
	if (IsQuote(front())) {
		const char stop = *p++;
		return NextQuotedValue(stop);
	} else
		return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (stop == '"') {
		char *dest = ++p;
		char *const value = dest;

		while (true) {
			char ch = *p++;

			if (ch == 0)
				return nullptr;
			else if (ch == stop) {
				*dest = 0;
				Strip();
				return value;
			} else if (ch == '\\') {
				ch = *p++;

				switch (ch) {
				case 'r':
					*dest++ = '\r';
					break;

				case 'n':
					*dest++ = '\n';
					break;

				case 't':
					*dest++ = '\t';
					break;

				case '\\':
				case '\'':
				case '"':
					*dest++ = ch;
					break;

				default:
					return nullptr;
				}
			} else
				*dest++ = ch;
		}
	} else
		return NextValue();
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("yes/no expected");

	if (strcmp(value, "yes") == 0)
		return true;
	else if (strcmp(value, "no") == 0)
		return false;
	else
		throw Error("yes/no expected");
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
