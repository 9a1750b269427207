// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "MatchData.hxx"

#include <new>
#include <string_view>

class RegexPointer {
protected:
	pcre2_code_8 *re = nullptr;

	unsigned n_capture = 0;

public:
	constexpr bool IsDefined() const noexcept {
		return re != nullptr;
	}

	constexpr unsigned GetCaptureCount() const noexcept {
		return n_capture;
	}

	/**
	 * Allocate a #MatchData which is large enough for all
	 * captures of this pattern.  It may be passed to Match()
	 * repeatedly.
	 *
	 * Throws std::bad_alloc on error.
	 */
	MatchData CreateMatchData() const {
		auto *match_data = pcre2_match_data_create_from_pattern_8(re, nullptr);
		if (match_data == nullptr)
			throw std::bad_alloc{};

		return MatchData{match_data};
	}

	/**
	 * Search the subject for a match, starting at the given
	 * offset, and store the result in an existing #MatchData
	 * (which must have been created by this object).
	 * Lookbehind assertions (e.g. \b) may inspect the characters
	 * before #start_offset.
	 *
	 * @return true on match
	 */
	bool Match(MatchData &md, std::string_view s,
		   std::size_t start_offset=0) const noexcept {
		md.s = s.data();
		md.n = pcre2_match_8(re, (PCRE2_SPTR8)s.data(), s.size(),
				     start_offset, 0, md.match_data, nullptr);
		if (md.n == 0 || (md.n > 0 && n_capture >= unsigned(md.n)))
			/* the ovector has room for all captures;
			   trailing unset ones are PCRE2_UNSET */
			md.n = n_capture + 1;

		return md;
	}

	/**
	 * Like Match(MatchData &, ...), but allocates a new
	 * #MatchData.
	 *
	 * Throws std::bad_alloc if the match data cannot be
	 * allocated.
	 */
	MatchData Match(std::string_view s, std::size_t start_offset=0) const {
		auto md = CreateMatchData();
		Match(md, s, start_offset);
		return md;
	}
};
