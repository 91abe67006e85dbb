// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Sink.hxx"

#include <span>

/**
 * A #Sink which collects small writes in a buffer and passes them
 * to the next sink in one piece.  Writes which are at least as
 * large as the buffer bypass it.
 *
 * The buffer is owned by the caller, and it must outlive this
 * object.
 */
class BufferedSink final : public Sink {
	Sink &next;

	const std::span<std::byte> buffer;

	std::size_t fill = 0;

public:
	BufferedSink(Sink &_next, std::span<std::byte> _buffer) noexcept
		:next(_next), buffer(_buffer) {}

	/**
	 * Pass remaining buffered data to the next sink.  Errors are
	 * logged and discarded; call Flush() to catch them.
	 */
	~BufferedSink() noexcept override;

	std::size_t GetBufferedSize() const noexcept {
		return fill;
	}

	/* virtual methods from class Sink */
	std::size_t WriteSome(std::span<const std::byte> src) override;
	void Flush() override;

private:
	/**
	 * Pass the buffer contents to the next sink.  The buffer is
	 * cleared even if this throws.
	 */
	void Drain();
};
