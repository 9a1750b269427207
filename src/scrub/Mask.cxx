// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Mask.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

namespace Scrub {

/**
 * Return the part of the string before the second occurrence of the
 * given separator, and the number of groups in the whole string.
 */
static constexpr std::pair<std::string_view, std::size_t>
SplitTwoGroups(std::string_view value, char separator) noexcept
{
	const std::size_t n_groups =
		std::count(value.begin(), value.end(), separator) + 1;

	const auto first = value.find(separator);
	if (first == value.npos)
		return {value, n_groups};

	const auto second = value.find(separator, first + 1);
	if (second == value.npos)
		return {value, n_groups};

	return {value.substr(0, second), n_groups};
}

std::pair<std::string_view, std::string_view>
MaskAddress(AddressKind kind, std::string_view value) noexcept
{
	switch (kind) {
	case AddressKind::IPV4:
		/* IPv4: the last two octets are always replaced,
		   no matter how many there are */
		return {SplitTwoGroups(value, '.').first, ".XXX.XXX"sv};

	case AddressKind::IPV6:
		break;
	}

	/* IPv6: keep the first two groups, one "XXXX" for each
	   remaining group */
	static constexpr auto masked_groups = ":XXXX:XXXX:XXXX:XXXX:XXXX:XXXX"sv;
	static constexpr std::size_t masked_group_length = 5;
	static constexpr std::size_t max_masked_groups =
		masked_groups.size() / masked_group_length;

	const auto [prefix, n_groups] = SplitTwoGroups(value, ':');
	const std::size_t n_masked =
		std::min(n_groups - std::min<std::size_t>(n_groups, 2),
			 max_masked_groups);

	return {prefix, masked_groups.substr(0, n_masked * masked_group_length)};
}

} // namespace Scrub
