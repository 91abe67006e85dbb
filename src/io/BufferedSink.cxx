// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BufferedSink.hxx"
#include "Logger.hxx"

#include <algorithm>
#include <exception>
#include <utility>

static constexpr Logger logger{"BufferedSink"};

BufferedSink::~BufferedSink() noexcept
{
	if (fill == 0)
		return;

	try {
		Drain();
	} catch (...) {
		logger(2, "Failed to drain buffer", std::current_exception());
	}
}

void
BufferedSink::Drain()
{
	const auto data = buffer.first(std::exchange(fill, 0));
	logger.Fmt(5, "draining {} bytes", data.size());
	WriteFull(next, data);
}

std::size_t
BufferedSink::WriteSome(std::span<const std::byte> src)
{
	if (src.empty())
		return 0;

	if (fill == 0 && src.size() >= buffer.size()) {
		WriteFull(next, src);
		return src.size();
	}

	if (fill == buffer.size())
		Drain();

	const auto w = buffer.subspan(fill);
	if (src.size() > w.size())
		src = src.first(w.size());

	std::copy(src.begin(), src.end(), w.begin());
	fill += src.size();
	return src.size();
}

void
BufferedSink::Flush()
{
	if (fill > 0)
		Drain();

	next.Flush();
}
