// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstring>
#include <string_view>

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqual(const char *a, const char *b) noexcept
{
	return std::strcmp(a, b) == 0;
}

/**
 * Checks whether the string begins with the specified prefix.  If
 * yes, then a pointer to the rest of the string is returned,
 * nullptr otherwise.
 */
[[gnu::pure]] [[gnu::nonnull]]
static inline const char *
StringAfterPrefix(const char *haystack, std::string_view prefix) noexcept
{
	return std::strncmp(haystack, prefix.data(), prefix.size()) == 0
		? haystack + prefix.size()
		: nullptr;
}

/**
 * If the string begins with the specified prefix, remove it and
 * return true.
 */
static inline bool
SkipPrefix(std::string_view &haystack, std::string_view prefix) noexcept
{
	bool match = haystack.starts_with(prefix);
	if (match)
		haystack.remove_prefix(prefix.size());
	return match;
}
