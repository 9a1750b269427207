// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Address.hxx"

#include <string_view>
#include <utility>

namespace Scrub {

/**
 * Mask an address, keeping only its first two groups.  IPv4
 * addresses always end up with four groups (the last two being
 * "XXX"); with IPv6, each group after the second one is replaced by
 * "XXXX" (at most eight groups are produced).
 *
 * The result is returned as a pair of strings which need to be
 * concatenated: the first one is a prefix of the given value, the
 * second one a string literal.
 */
[[gnu::pure]]
std::pair<std::string_view, std::string_view>
MaskAddress(AddressKind kind, std::string_view value) noexcept;

} // namespace Scrub
