// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <functional>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>

namespace Scrub {

/**
 * A set of literal addresses which are never transformed.  The
 * comparison is a plain byte-by-byte string comparison: there is no
 * normalization, so "127.0.0.1" does not exclude "127.000.000.001".
 *
 * The list is immutable after construction.
 */
class ExclusionList {
	std::set<std::string, std::less<>> entries;

public:
	ExclusionList() = default;

	template<typename I>
	ExclusionList(I first, I last) {
		for (; first != last; ++first)
			entries.emplace(*first);
	}

	ExclusionList(std::initializer_list<std::string_view> l)
		:ExclusionList(l.begin(), l.end()) {}

	/**
	 * The built-in list: the IPv4 loopback and "any" addresses
	 * and the full forms of the IPv6 loopback address.
	 */
	static ExclusionList Default();

	/**
	 * Return a copy of this list with additional entries.
	 */
	template<typename R>
	[[nodiscard]]
	ExclusionList With(const R &more) const {
		ExclusionList result(*this);
		for (const auto &i : more)
			result.entries.emplace(i);
		return result;
	}

	bool empty() const noexcept {
		return entries.empty();
	}

	std::size_t size() const noexcept {
		return entries.size();
	}

	auto begin() const noexcept {
		return entries.begin();
	}

	auto end() const noexcept {
		return entries.end();
	}

	/**
	 * Is the given (bracket-stripped) address listed?
	 */
	[[gnu::pure]]
	bool Contains(std::string_view address) const noexcept {
		return entries.find(address) != entries.end();
	}
};

} // namespace Scrub
