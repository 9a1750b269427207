// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#ifndef PCRE2_CODE_UNIT_WIDTH
#define PCRE2_CODE_UNIT_WIDTH 8
#endif

#include <pcre2.h>

#include <cassert>
#include <cstddef>
#include <string_view>
#include <utility>

/**
 * The result of RegexPointer::Match().  It owns the PCRE2 match data
 * and refers to the subject string of the most recent match, which
 * must remain valid.  One instance may be reused for many matches
 * (see RegexPointer::CreateMatchData()).
 */
class MatchData {
	friend class RegexPointer;

	pcre2_match_data_8 *match_data = nullptr;
	const char *s = nullptr;
	PCRE2_SIZE *ovector = nullptr;

	/**
	 * The return value of pcre2_match(): the number of captures
	 * plus one, or a negative error code.
	 */
	int n = PCRE2_ERROR_NOMATCH;

	explicit MatchData(pcre2_match_data_8 *_md) noexcept
		:match_data(_md),
		 ovector(pcre2_get_ovector_pointer_8(match_data))
	{
	}

public:
	MatchData() = default;

	MatchData(MatchData &&src) noexcept
		:match_data(std::exchange(src.match_data, nullptr)),
		 s(src.s), ovector(src.ovector), n(src.n) {}

	~MatchData() noexcept {
		if (match_data != nullptr)
			pcre2_match_data_free_8(match_data);
	}

	MatchData &operator=(MatchData &&src) noexcept {
		using std::swap;
		swap(match_data, src.match_data);
		swap(s, src.s);
		swap(ovector, src.ovector);
		swap(n, src.n);
		return *this;
	}

	static constexpr std::size_t npos = ~std::size_t{};

	constexpr operator bool() const noexcept {
		return n > 0;
	}

	/**
	 * Did pcre2_match() fail with an error (other than "no
	 * match")?
	 */
	constexpr bool IsError() const noexcept {
		return n < 0 && n != PCRE2_ERROR_NOMATCH;
	}

	constexpr int GetErrorCode() const noexcept {
		return n;
	}

	constexpr std::size_t size() const noexcept {
		assert(n > 0);

		return static_cast<std::size_t>(n);
	}

	[[gnu::pure]]
	std::string_view operator[](std::size_t i) const noexcept {
		assert(n > 0);

		if (i >= size())
			return {};

		const auto start = ovector[2 * i];
		if (start == PCRE2_UNSET)
			return {};

		const auto end = ovector[2 * i + 1];
		assert(end >= start);

		return { s + start, end - start };
	}

	[[gnu::pure]]
	std::size_t GetCaptureStart(std::size_t i) const noexcept {
		assert(n > 0);

		if (i >= size())
			return npos;

		const auto start = ovector[2 * i];
		if (start == PCRE2_UNSET)
			return npos;

		return start;
	}

	[[gnu::pure]]
	std::size_t GetCaptureEnd(std::size_t i) const noexcept {
		assert(n > 0);

		if (i >= size())
			return npos;

		const auto end = ovector[2 * i + 1];
		if (end == PCRE2_UNSET)
			return npos;

		return end;
	}
};
