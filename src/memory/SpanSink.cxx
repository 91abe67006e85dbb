// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SpanSink.hxx"
#include "io/SinkError.hxx"

#include <algorithm>

std::size_t
SpanSink::WriteSome(std::span<const std::byte> src)
{
	if (src.empty())
		return 0;

	const auto w = buffer.subspan(fill);
	if (w.empty())
		throw SinkFullError{};

	if (src.size() > w.size())
		src = src.first(w.size());

	std::copy(src.begin(), src.end(), w.begin());
	fill += src.size();
	return src.size();
}
