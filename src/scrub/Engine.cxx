// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Engine.hxx"
#include "Scanner.hxx"
#include "ExclusionList.hxx"
#include "GeoLookup.hxx"
#include "Mask.hxx"

namespace Scrub {

inline void
RedactionEngine::AppendMasked(std::string &dest,
			      const AddressCandidate &candidate)
{
	const auto [prefix, suffix] = MaskAddress(candidate.kind,
						  candidate.value);

	if (candidate.HasBrackets())
		dest.push_back('[');

	dest.append(prefix);
	dest.append(suffix);

	if (candidate.HasBrackets())
		dest.push_back(']');
}

void
RedactionEngine::AppendReplacement(std::string &dest,
				   const AddressCandidate &candidate,
				   RedactionStats &stats) const
{
	if (exclusions.Contains(candidate.value)) {
		++stats.excluded;
		dest.append(candidate.span);
		return;
	}

	if (mode == RedactionMode::COUNTRY_CODE) {
		const auto result = lookup != nullptr
			? lookup->LookupCountry(candidate.value)
			: GeoLookupResult::Failure();

		if (result.IsFound()) {
			/* the placeholder replaces the whole span,
			   brackets included */
			++stats.country;
			dest.push_back('[');
			dest.append(result.GetCountryCode());
			dest.push_back(']');
			return;
		}

		++stats.lookup_failures;
	}

	++stats.masked;
	AppendMasked(dest, candidate);
}

std::string
RedactionEngine::Transform(std::string_view text, RedactionStats &stats) const
{
	std::string result;
	result.reserve(text.size());

	auto scanner = pattern.Scan(text);

	std::size_t position = 0;
	for (const auto &candidate : scanner) {
		++stats.candidates;

		result.append(text.substr(position,
					  candidate.begin - position));
		AppendReplacement(result, candidate, stats);
		position = candidate.end;
	}

	result.append(text.substr(position));

	stats.scanner_errors += scanner.GetErrorCount();
	return result;
}

} // namespace Scrub
