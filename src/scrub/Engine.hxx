// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Policy.hxx"

#include <string>
#include <string_view>

namespace Scrub {

struct AddressCandidate;
class AddressPattern;
class ExclusionList;
class CountryLookup;

/**
 * Counters collected by RedactionEngine::Transform().  They allow
 * logging the outcome without logging any address.
 */
struct RedactionStats {
	unsigned candidates = 0;

	/**
	 * Candidates which were found in the #ExclusionList and were
	 * copied unchanged.
	 */
	unsigned excluded = 0;

	unsigned masked = 0;

	unsigned country = 0;

	/**
	 * Country lookups which failed; each of these candidates was
	 * masked instead (and is also counted in #masked).
	 */
	unsigned lookup_failures = 0;

	/**
	 * Regex engine errors; the scanner skipped one byte for each.
	 */
	unsigned scanner_errors = 0;
};

/**
 * Replaces all addresses in a text according to a #RedactionMode.
 * All replacements are computed on the original text in one pass.
 */
class RedactionEngine {
	const AddressPattern &pattern;
	const ExclusionList &exclusions;

	/**
	 * The country database; nullptr if none is available (in
	 * which case #COUNTRY_CODE behaves like #MASK).
	 */
	CountryLookup *const lookup;

	const RedactionMode mode;

public:
	RedactionEngine(const AddressPattern &_pattern,
			const ExclusionList &_exclusions,
			RedactionMode _mode,
			CountryLookup *_lookup=nullptr) noexcept
		:pattern(_pattern), exclusions(_exclusions),
		 lookup(_lookup), mode(_mode) {}

	/**
	 * Return a copy of the given text with all addresses
	 * replaced.  Errors concerning a single address (lookup
	 * failures, regex engine errors) are handled internally and
	 * counted in #stats.
	 *
	 * Throws std::bad_alloc if out of memory.
	 */
	std::string Transform(std::string_view text, RedactionStats &stats) const;

private:
	void AppendReplacement(std::string &dest,
			       const AddressCandidate &candidate,
			       RedactionStats &stats) const;

	static void AppendMasked(std::string &dest,
				 const AddressCandidate &candidate);
};

} // namespace Scrub
