// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string_view>

namespace Scrub {

enum class AddressKind {
	IPV4,
	IPV6,
};

/**
 * An address-shaped substring found by #AddressScanner.  All string
 * views point into the scanned text.
 */
struct AddressCandidate {
	/**
	 * The whole matched span, including the surrounding brackets
	 * (if any).
	 */
	std::string_view span;

	/**
	 * The address without brackets.
	 */
	std::string_view value;

	/**
	 * Offsets of #span within the scanned text.
	 */
	std::size_t begin, end;

	AddressKind kind;

	constexpr bool HasBrackets() const noexcept {
		return span.size() != value.size();
	}
};

/**
 * Classify an address by its separator character.
 */
[[gnu::pure]]
constexpr AddressKind
ClassifyAddress(std::string_view value) noexcept
{
	return value.find('.') != value.npos
		? AddressKind::IPV4
		: AddressKind::IPV6;
}

} // namespace Scrub
