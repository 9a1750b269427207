// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Address.hxx"
#include "lib/pcre/UniqueRegex.hxx"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

namespace Scrub {

class AddressScanner;

/**
 * The compiled address pattern.  It matches:
 *
 * - IPv4: four dot-separated groups of 1-3 decimal digits (octet
 *   values are not range-checked)
 *
 * - IPv6: exactly eight colon-separated groups of 1-4 hexadecimal
 *   digits (the "::" shorthand is not recognized)
 *
 * Both shapes must be delimited by word boundaries.  A candidate
 * enclosed in "[" and "]" is matched together with the brackets.
 */
class AddressPattern {
	UniqueRegex regex;

public:
	/**
	 * Throws std::system_error if the pattern cannot be compiled.
	 */
	AddressPattern();

	/**
	 * Throws std::bad_alloc if the match data cannot be
	 * allocated.
	 */
	AddressScanner Scan(std::string_view text) const;
};

/**
 * Produces the #AddressCandidate instances of a text, left to right,
 * without overlaps.  Scanning happens on demand in Next(); the
 * object is also an input range for range-based "for" loops.
 */
class AddressScanner {
	const RegexPointer &regex;

	/**
	 * Reused by all Next() calls.
	 */
	MatchData match_data;

	std::string_view text;

	std::size_t position = 0;

	/**
	 * The number of regex engine failures (other than "no
	 * match"); each one skips one byte.
	 */
	unsigned n_errors = 0;

public:
	AddressScanner(const RegexPointer &_regex, std::string_view _text)
		:regex(_regex), match_data(regex.CreateMatchData()),
		 text(_text) {}

	AddressScanner(const AddressScanner &) = delete;
	AddressScanner &operator=(const AddressScanner &) = delete;

	/**
	 * Find the next candidate.  Returns std::nullopt at the end
	 * of the text.
	 */
	std::optional<AddressCandidate> Next();

	unsigned GetErrorCount() const noexcept {
		return n_errors;
	}

	class iterator {
		AddressScanner *scanner = nullptr;
		std::optional<AddressCandidate> current;

	public:
		using iterator_category = std::input_iterator_tag;
		using value_type = AddressCandidate;
		using difference_type = std::ptrdiff_t;
		using pointer = const AddressCandidate *;
		using reference = const AddressCandidate &;

		iterator() = default;

		explicit iterator(AddressScanner &_scanner)
			:scanner(&_scanner), current(_scanner.Next()) {}

		reference operator*() const noexcept {
			return *current;
		}

		pointer operator->() const noexcept {
			return &*current;
		}

		iterator &operator++() {
			current = scanner->Next();
			return *this;
		}

		bool operator==(const iterator &other) const noexcept {
			/* only comparisons with end() are meaningful */
			return current.has_value() == other.current.has_value();
		}
	};

	iterator begin() {
		return iterator{*this};
	}

	iterator end() noexcept {
		return {};
	}
};

} // namespace Scrub
