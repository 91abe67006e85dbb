// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FdSink.hxx"

#include <system_error>

#include <errno.h>
#include <unistd.h>

std::size_t
FdSink::WriteSome(std::span<const std::byte> src)
{
	if (src.empty())
		return 0;

	while (true) {
		const ssize_t nbytes = write(fd, src.data(), src.size());
		if (nbytes >= 0)
			return (std::size_t)nbytes;

		if (errno != EINTR)
			throw std::system_error(errno, std::system_category(),
						"Failed to write");
	}
}
