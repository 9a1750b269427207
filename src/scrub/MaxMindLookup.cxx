// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MaxMindLookup.hxx"

#include <algorithm>
#include <system_error>

namespace Scrub {

GeoLookupResult
MaxMindCountryLookup::LookupCountry(std::string_view address) noexcept
{
	/* libmaxminddb wants a null-terminated string; addresses
	   longer than this cannot be valid */
	char buffer[64];
	if (address.size() >= sizeof(buffer))
		return GeoLookupResult::Failure();

	*std::copy(address.begin(), address.end(), buffer) = 0;

	try {
		return GeoLookupResult::Found(db.LookupCountryCode(buffer));
	} catch (const std::system_error &) {
		/* malformed address or corrupt database record; the
		   caller falls back to masking */
		return GeoLookupResult::Failure();
	}
}

} // namespace Scrub
