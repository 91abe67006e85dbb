// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Definitions for the HTTP/1.1 chunked transfer encoding (RFC 7230
 * 4.1) as emitted by ChunkedWriter.
 */

#pragma once

#include <cstddef>
#include <string_view>

namespace ChunkedProtocol {

using std::string_view_literals::operator""sv;

/**
 * Terminates the chunk size line and each chunk's data.
 */
inline constexpr std::string_view CRLF = "\r\n"sv;

/**
 * The zero-length last chunk followed by an empty trailer section.
 */
inline constexpr std::string_view TERMINATOR = "0\r\n\r\n"sv;

/**
 * Maximum number of hex digits needed to encode a std::size_t.
 */
inline constexpr std::size_t MAX_SIZE_DIGITS = sizeof(std::size_t) * 2;

/**
 * Maximum length of a chunk size line including its CRLF.  Chunk
 * extensions are never emitted.
 */
inline constexpr std::size_t MAX_HEADER_SIZE = MAX_SIZE_DIGITS + CRLF.size();

/**
 * Number of framing bytes added to a chunk with the given payload
 * length.
 */
constexpr std::size_t
FramingOverhead(std::size_t length) noexcept
{
	std::size_t digits = 1;
	while (length >= 0x10) {
		length >>= 4;
		++digits;
	}

	return digits + CRLF.size() + CRLF.size();
}

} // namespace ChunkedProtocol
