// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ExclusionList.hxx"

using std::string_view_literals::operator""sv;

namespace Scrub {

ExclusionList
ExclusionList::Default()
{
	return {
		"127.0.0.1"sv,
		"0.0.0.0"sv,
		"0:0:0:0:0:0:0:1"sv,
		"0000:0000:0000:0000:0000:0000:0000:0001"sv,
	};
}

} // namespace Scrub
