// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UTF8.hxx"
#include "CharUtil.hxx"

using std::string_view_literals::operator""sv;

static constexpr auto REPLACEMENT_CHARACTER = "\xef\xbf\xbd"sv;

static constexpr bool
IsContinuation(unsigned char ch) noexcept
{
	return (ch & 0xc0) == 0x80;
}

std::size_t
SequenceLengthUTF8(std::string_view s, std::size_t &invalid_length) noexcept
{
	const auto *p = reinterpret_cast<const unsigned char *>(s.data());
	const std::size_t size = s.size();

	const unsigned char lead = p[0];
	if (IsASCII(lead))
		return 1;

	/* the valid range of the second byte depends on the lead
	   byte; this rejects overlong forms, surrogates and code
	   points beyond U+10FFFF */
	std::size_t length;
	unsigned char min2 = 0x80, max2 = 0xbf;

	if (lead >= 0xc2 && lead <= 0xdf) {
		length = 2;
	} else if (lead >= 0xe0 && lead <= 0xef) {
		length = 3;
		if (lead == 0xe0)
			min2 = 0xa0;
		else if (lead == 0xed)
			max2 = 0x9f;
	} else if (lead >= 0xf0 && lead <= 0xf4) {
		length = 4;
		if (lead == 0xf0)
			min2 = 0x90;
		else if (lead == 0xf4)
			max2 = 0x8f;
	} else {
		invalid_length = 1;
		return 0;
	}

	if (size < 2 || p[1] < min2 || p[1] > max2) {
		invalid_length = 1;
		return 0;
	}

	for (std::size_t i = 2; i < length; ++i) {
		if (i >= size || !IsContinuation(p[i])) {
			invalid_length = i;
			return 0;
		}
	}

	return length;
}

bool
ValidateUTF8(std::string_view s) noexcept
{
	while (!s.empty()) {
		std::size_t invalid_length;
		const std::size_t length = SequenceLengthUTF8(s, invalid_length);
		if (length == 0)
			return false;

		s.remove_prefix(length);
	}

	return true;
}

std::string
SanitizeUTF8(std::string_view src)
{
	std::string result;
	result.reserve(src.size());

	std::string_view valid = src;
	std::size_t valid_length = 0;

	while (!src.empty()) {
		std::size_t invalid_length;
		const std::size_t length = SequenceLengthUTF8(src, invalid_length);
		if (length > 0) {
			valid_length += length;
			src.remove_prefix(length);
			continue;
		}

		result.append(valid.substr(0, valid_length));
		result.append(REPLACEMENT_CHARACTER);

		src.remove_prefix(invalid_length);
		valid = src;
		valid_length = 0;
	}

	result.append(valid.substr(0, valid_length));
	return result;
}
