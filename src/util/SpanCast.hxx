// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

[[gnu::pure]]
inline std::span<const std::byte>
AsBytes(std::string_view sv) noexcept
{
	return std::as_bytes(std::span{sv.data(), sv.size()});
}
