// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Sink.hxx"
#include "SinkError.hxx"

#include <cassert>

void
WriteFull(Sink &sink, std::span<const std::byte> src)
{
	while (!src.empty()) {
		const std::size_t nbytes = sink.WriteSome(src);
		if (nbytes == 0)
			throw SinkStalledError{};

		assert(nbytes <= src.size());
		src = src.subspan(nbytes);
	}
}
