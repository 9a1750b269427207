// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/**
 * Is this a valid UTF-8 string?
 */
[[gnu::pure]]
bool
ValidateUTF8(std::string_view s) noexcept;

/**
 * Determine the length of the well-formed UTF-8 sequence at the
 * beginning of the given string.  Returns 0 if the sequence is
 * malformed; in that case, #invalid_length receives the number of
 * bytes which make up the maximal invalid subpart (at least 1).
 */
[[gnu::pure]]
std::size_t
SequenceLengthUTF8(std::string_view s, std::size_t &invalid_length) noexcept;

/**
 * Copy the given string, replacing each maximal invalid subpart with
 * U+FFFD REPLACEMENT CHARACTER.  Valid input is returned unmodified.
 */
std::string
SanitizeUTF8(std::string_view src);
