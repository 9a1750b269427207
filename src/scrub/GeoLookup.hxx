// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/CharUtil.hxx"

#include <array>
#include <string_view>

namespace Scrub {

/**
 * The outcome of a country lookup: either a two-letter ISO 3166-1
 * code or failure.  Failure does not distinguish between "not found"
 * and errors.
 */
class GeoLookupResult {
	std::array<char, 2> code;
	bool found = false;

	constexpr GeoLookupResult(char a, char b) noexcept
		:code{a, b}, found(true) {}

public:
	constexpr GeoLookupResult() noexcept:code{} {}

	static constexpr GeoLookupResult Failure() noexcept {
		return {};
	}

	/**
	 * Construct a successful result.  Anything which is not two
	 * ASCII letters is considered a failure.  Lower case letters
	 * are converted to upper case.
	 */
	static constexpr GeoLookupResult Found(std::string_view iso_code) noexcept {
		if (iso_code.size() != 2 ||
		    !IsAlphaASCII(iso_code[0]) || !IsAlphaASCII(iso_code[1]))
			return Failure();

		return {ToUpperASCII(iso_code[0]), ToUpperASCII(iso_code[1])};
	}

	constexpr bool IsFound() const noexcept {
		return found;
	}

	/**
	 * Returns the country code.  Only valid if IsFound() is true.
	 */
	constexpr std::string_view GetCountryCode() const noexcept {
		return {code.data(), code.size()};
	}
};

/**
 * Interface for looking up the country of an address.
 */
class CountryLookup {
public:
	virtual ~CountryLookup() noexcept = default;

	/**
	 * @param address an IPv4 or IPv6 address in textual notation
	 * (without brackets)
	 */
	virtual GeoLookupResult LookupCountry(std::string_view address) noexcept = 0;
};

} // namespace Scrub
