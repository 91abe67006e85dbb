// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>

/**
 * A destination for a sequence of bytes: a socket, a buffer, a
 * file.
 */
class Sink {
public:
	Sink() = default;
	Sink(const Sink &) = delete;
	Sink &operator=(const Sink &) = delete;

	virtual ~Sink() noexcept = default;

	/**
	 * Write some of the given data.  Throws on error.
	 *
	 * @return the number of bytes accepted, which may be less
	 * than src.size(); must not be 0 for a non-empty #src
	 */
	virtual std::size_t WriteSome(std::span<const std::byte> src) = 0;

	/**
	 * Push data buffered by this sink (or by sinks behind it) to
	 * its final destination.  Throws on error.
	 */
	virtual void Flush() {}
};

/**
 * Write all of the given data, repeating Sink::WriteSome() after
 * short writes.  Throws #SinkStalledError if the sink accepts
 * nothing; exceptions thrown by the sink are propagated unchanged.
 */
void
WriteFull(Sink &sink, std::span<const std::byte> src);
