// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "RegexPointer.hxx"

#include <utility>

/**
 * A compiled PCRE2 pattern which is freed by the destructor.
 */
class UniqueRegex : public RegexPointer {
public:
	UniqueRegex() = default;

	/**
	 * Throws std::system_error (with Pcre::error_category) on
	 * error.
	 */
	explicit UniqueRegex(const char *pattern, bool anchored, bool capture) {
		Compile(pattern, anchored, capture);
	}

	UniqueRegex(UniqueRegex &&src) noexcept {
		re = std::exchange(src.re, nullptr);
		n_capture = std::exchange(src.n_capture, 0);
	}

	~UniqueRegex() noexcept {
		Free();
	}

	UniqueRegex &operator=(UniqueRegex &&src) noexcept {
		using std::swap;
		swap(re, src.re);
		swap(n_capture, src.n_capture);
		return *this;
	}

	/**
	 * Compile a new pattern, replacing the old one.  Capturing
	 * groups are only enabled if #capture is true.
	 *
	 * Throws std::system_error (with Pcre::error_category) on
	 * error; in that case, this object is undefined.
	 */
	void Compile(const char *pattern, bool anchored, bool capture);

private:
	void Free() noexcept {
		if (re != nullptr)
			pcre2_code_free_8(std::exchange(re, nullptr));
		n_capture = 0;
	}
};
