// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Scanner.hxx"

namespace Scrub {

/* capture 1 is the opening bracket, capture 2 the address; the
   conditional group requires a closing bracket if (and only if)
   there was an opening one */
static constexpr char address_pattern[] =
	R"((\[)?\b()"
	R"((?:[0-9]{1,3}\.){3}[0-9]{1,3})"
	R"(|)"
	R"((?:[0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4})"
	R"()\b(?(1)\]))";

AddressPattern::AddressPattern()
	:regex(address_pattern, false, true)
{
}

AddressScanner
AddressPattern::Scan(std::string_view text) const
{
	return {regex, text};
}

std::optional<AddressCandidate>
AddressScanner::Next()
{
	while (position < text.size()) {
		if (!regex.Match(match_data, text, position)) {
			if (match_data.IsError()) {
				++n_errors;
				++position;
				continue;
			}

			position = text.size();
			break;
		}

		const auto &m = match_data;
		const std::size_t begin = m.GetCaptureStart(0);
		const std::size_t end = m.GetCaptureEnd(0);
		position = end;

		const auto value = m[2];
		return AddressCandidate{
			.span = m[0],
			.value = value,
			.begin = begin,
			.end = end,
			.kind = ClassifyAddress(value),
		};
	}

	return std::nullopt;
}

} // namespace Scrub
