// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

namespace Scrub {

enum class RedactionMode {
	/**
	 * Replace the trailing groups of each address with "X".
	 */
	MASK,

	/**
	 * Replace each address with its country code in brackets
	 * (e.g. "[US]"); if the country cannot be determined, fall
	 * back to #MASK.
	 */
	COUNTRY_CODE,
};

} // namespace Scrub
