// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Sink.hxx"

/**
 * A #Sink which writes to a file descriptor (a socket, a pipe or a
 * regular file).  The descriptor is not owned; the caller closes it
 * after this object has been destroyed.
 *
 * Non-blocking descriptors are not supported: EAGAIN is reported as
 * an error.
 */
class FdSink final : public Sink {
	const int fd;

public:
	explicit FdSink(int _fd) noexcept
		:fd(_fd) {}

	int Get() const noexcept {
		return fd;
	}

	/* virtual methods from class Sink */
	std::size_t WriteSome(std::span<const std::byte> src) override;
};
