// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ChunkedWriter.hxx"

#include <concepts>
#include <utility>

/**
 * Write a complete chunked body to the given sink: the callback
 * receives a #ChunkedWriter and writes the body through it, and
 * afterwards the terminating chunk is sent.
 *
 * Errors from the terminating chunk are thrown to the caller.  If
 * the callback throws, the terminator is still sent (failures doing
 * so are only logged) and the callback's exception is propagated.
 */
template<std::invocable<ChunkedWriter &> F>
void
WriteChunkedBody(Sink &sink, F &&f)
{
	ChunkedWriter writer{sink};
	std::forward<F>(f)(writer);
	writer.Finish();
}
