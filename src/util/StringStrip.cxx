// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <cstddef>
#include <string.h>

const char *
StripLeft(const char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;

	return p;
}

const char *
StripRight(const char *p, const char *end) noexcept
{
	while (end > p && IsWhitespaceOrNull(end[-1]))
		--end;

	return end;
}

void
StripRight(char *p) noexcept
{
	std::size_t old_length = strlen(p);
	std::size_t new_length = StripRight(p, p + old_length) - p;
	p[new_length] = 0;
}
