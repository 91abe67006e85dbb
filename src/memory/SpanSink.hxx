// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Sink.hxx"

#include <span>

/**
 * A #Sink which copies into a fixed-size buffer owned by the
 * caller.  Once the buffer is full, writes throw #SinkFullError;
 * data is never dropped silently.
 */
class SpanSink final : public Sink {
	const std::span<std::byte> buffer;

	std::size_t fill = 0;

public:
	explicit SpanSink(std::span<std::byte> _buffer) noexcept
		:buffer(_buffer) {}

	std::size_t GetCapacity() const noexcept {
		return buffer.size();
	}

	std::size_t GetSize() const noexcept {
		return fill;
	}

	bool IsFull() const noexcept {
		return fill == buffer.size();
	}

	/**
	 * Returns the portion of the buffer which has been written.
	 */
	std::span<const std::byte> GetData() const noexcept {
		return buffer.first(fill);
	}

	/* virtual methods from class Sink */
	std::size_t WriteSome(std::span<const std::byte> src) override;
};
