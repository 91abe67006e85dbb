// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Conversions between character and byte views.
 */

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

[[gnu::pure]]
inline std::span<const std::byte>
ToByteSpan(std::string_view s) noexcept
{
	return std::as_bytes(std::span{s.data(), s.size()});
}

[[gnu::pure]]
inline std::string_view
ToCharView(std::span<const std::byte> s) noexcept
{
	return {reinterpret_cast<const char *>(s.data()), s.size()};
}
