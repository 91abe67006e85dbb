// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Sink.hxx"

#include <stdexcept>
#include <string_view>

/**
 * Thrown by ChunkedWriter::Write() after the body has been
 * finished.
 */
class ChunkedWriterFinishedError : public std::logic_error {
public:
	ChunkedWriterFinishedError()
		:std::logic_error("Chunked body already finished") {}
};

/**
 * A #Sink decorator which adds HTTP chunking: each write becomes
 * exactly one chunk, and Finish() appends the terminating empty
 * chunk.  Data is passed through to the next sink without being
 * copied, and nothing is allocated on the heap.
 *
 * Writing an empty buffer emits "0\r\n\r\n", which a peer cannot
 * tell apart from the terminator; don't do that unless you mean to
 * end the body.
 *
 * To get fewer (and larger) chunks, put a #BufferedSink in front of
 * this object.
 */
class ChunkedWriter final : public Sink {
	Sink &next;

	bool finished = false;

public:
	explicit ChunkedWriter(Sink &_next) noexcept
		:next(_next) {}

	/**
	 * Finishes the body if Finish() has not been called.  Errors
	 * cannot be reported from here; they are logged and
	 * discarded.  Call Finish() explicitly to catch them.
	 */
	~ChunkedWriter() noexcept override;

	ChunkedWriter(const ChunkedWriter &) = delete;
	ChunkedWriter &operator=(const ChunkedWriter &) = delete;

	bool IsFinished() const noexcept {
		return finished;
	}

	/**
	 * Send the given data as one chunk.  Throws on error; the
	 * partial chunk remains in the next sink.
	 *
	 * @return src.size()
	 */
	std::size_t Write(std::span<const std::byte> src);

	std::size_t Write(std::string_view src);

	/**
	 * Send the terminating chunk and flush the next sink.  The
	 * flush is attempted even if the terminator fails; the
	 * terminator's error is thrown then.
	 *
	 * The object is marked finished before anything is sent, so
	 * the terminator is written at most once: only the first call
	 * has an effect, even if it throws.
	 */
	void Finish();

	/* virtual methods from class Sink */
	std::size_t WriteSome(std::span<const std::byte> src) override {
		return Write(src);
	}

	void Flush() override {
		next.Flush();
	}
};
