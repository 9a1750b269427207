// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"
#include "RegexPointer.hxx"

#include <iterator>

namespace Pcre {

ErrorCategory error_category;

std::string
ErrorCategory::message(int condition) const
{
	PCRE2_UCHAR8 buffer[256];
	const int length = pcre2_get_error_message_8(condition, buffer,
						     std::size(buffer));
	if (length < 0)
		return "Unknown PCRE2 error";

	return std::string{reinterpret_cast<const char *>(buffer),
			   std::size_t(length)};
}

} // namespace Pcre
