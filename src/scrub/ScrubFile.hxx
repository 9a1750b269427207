// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

namespace Scrub {

class RedactionEngine;
struct RedactionStats;

/**
 * Scrub the given text file in place: load it, replace all
 * addresses and replace the file atomically with the result.  Invalid
 * UTF-8 sequences are replaced with U+FFFD.  The new file gets the
 * permission bits of the old one.
 *
 * If this function throws, the file has not been modified and no
 * temporary file is left behind.
 *
 * Throws on error.
 */
void
ScrubFile(const char *path, const RedactionEngine &engine,
	  RedactionStats &stats);

} // namespace Scrub
