// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ChunkedWriter.hxx"
#include "Logger.hxx"
#include "memory/ByteView.hxx"
#include "chunk-writer/Chunked.hxx"

#include <fmt/format.h>

#include <array>
#include <exception>

static constexpr Logger logger{"ChunkedWriter"};

ChunkedWriter::~ChunkedWriter() noexcept
{
	if (finished)
		return;

	try {
		Finish();
	} catch (...) {
		logger(2, "Failed to finish chunked body",
		       std::current_exception());
	}
}

std::size_t
ChunkedWriter::Write(std::span<const std::byte> src)
{
	if (finished)
		throw ChunkedWriterFinishedError{};

	if (src.empty())
		logger(4, "empty chunk written; peer will see end of body");

	std::array<char, ChunkedProtocol::MAX_HEADER_SIZE> header;
	const auto r = fmt::format_to_n(header.data(), header.size(),
					"{:x}\r\n", src.size());

	WriteFull(next, ToByteSpan({header.data(), r.size}));
	WriteFull(next, src);
	WriteFull(next, ToByteSpan(ChunkedProtocol::CRLF));

	return src.size();
}

std::size_t
ChunkedWriter::Write(std::string_view src)
{
	return Write(ToByteSpan(src));
}

void
ChunkedWriter::Finish()
{
	if (finished)
		return;

	finished = true;

	try {
		WriteFull(next, ToByteSpan(ChunkedProtocol::TERMINATOR));
	} catch (...) {
		/* flush what did get through; the terminator's error is
		   the one reported */
		try {
			next.Flush();
		} catch (...) {
			logger(2, "Failed to flush after terminator error",
			       std::current_exception());
		}

		throw;
	}

	next.Flush();
}
