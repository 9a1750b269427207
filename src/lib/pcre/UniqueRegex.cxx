// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UniqueRegex.hxx"
#include "Error.hxx"

void
UniqueRegex::Compile(const char *pattern, bool anchored, bool capture)
{
	Free();

	constexpr uint32_t default_options = PCRE2_DOTALL|PCRE2_NO_AUTO_CAPTURE;

	uint32_t options = default_options;
	if (anchored)
		options |= PCRE2_ANCHORED;
	if (capture)
		options &= ~PCRE2_NO_AUTO_CAPTURE;

	int error_number;
	PCRE2_SIZE error_offset;
	re = pcre2_compile_8(PCRE2_SPTR8(pattern),
			     PCRE2_ZERO_TERMINATED, options,
			     &error_number, &error_offset,
			     nullptr);
	if (re == nullptr)
		throw Pcre::MakeError(error_number, "Error in regex");

	/* JIT is optional: if it is not available, pcre2_match()
	   falls back to the interpreter */
	pcre2_jit_compile_8(re, PCRE2_JIT_COMPLETE);

	if (capture) {
		uint32_t n;
		if (pcre2_pattern_info_8(re, PCRE2_INFO_CAPTURECOUNT, &n) == 0)
			n_capture = n;
	}
}
