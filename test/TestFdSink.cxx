// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "io/FdSink.hxx"
#include "http/ChunkedWriter.hxx"
#include "memory/ByteView.hxx"

#include <gtest/gtest.h>

#include <string>
#include <system_error>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

static std::string
ReadAll(int fd)
{
	std::string result;
	char buffer[256];

	while (true) {
		const ssize_t nbytes = read(fd, buffer, sizeof(buffer));
		if (nbytes < 0)
			throw std::system_error(errno, std::system_category(),
						"Failed to read");
		if (nbytes == 0)
			break;

		result.append(buffer, nbytes);
	}

	return result;
}

TEST(FdSink, Pipe)
{
	int fds[2];
	ASSERT_EQ(pipe2(fds, O_CLOEXEC), 0);

	{
		FdSink sink{fds[1]};
		EXPECT_EQ(sink.Get(), fds[1]);

		ChunkedWriter w{sink};
		w.Write("hello "sv);
		w.Write("1337"sv);
		w.Finish();
	}

	close(fds[1]);

	EXPECT_EQ(ReadAll(fds[0]), "6\r\nhello \r\n4\r\n1337\r\n0\r\n\r\n");
	close(fds[0]);
}

TEST(FdSink, Empty)
{
	FdSink sink{-1};
	EXPECT_EQ(sink.WriteSome({}), 0U);
}

TEST(FdSink, BadDescriptor)
{
	FdSink sink{-1};

	try {
		sink.WriteSome(ToByteSpan("x"sv));
		FAIL();
	} catch (const std::system_error &e) {
		EXPECT_EQ(e.code().value(), EBADF);
	}
}

TEST(FdSink, ErrorThroughChunkedWriter)
{
	FdSink sink{-1};
	ChunkedWriter w{sink};

	EXPECT_THROW(w.Write("x"sv), std::system_error);
	EXPECT_THROW(w.Finish(), std::system_error);
}
