// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RecordingSink.hxx"
#include "http/ChunkedBody.hxx"
#include "memory/StringSink.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

TEST(ChunkedBody, Basic)
{
	StringSink sink;

	WriteChunkedBody(sink, [](ChunkedWriter &w){
		w.Write("hello "sv);
		w.Write("1337"sv);
	});

	EXPECT_EQ(sink.GetValue(), "6\r\nhello \r\n4\r\n1337\r\n0\r\n\r\n"sv);
}

TEST(ChunkedBody, EarlyFinish)
{
	StringSink sink;

	WriteChunkedBody(sink, [](ChunkedWriter &w){
		w.Write("x"sv);
		w.Finish();
	});

	EXPECT_EQ(sink.GetValue(), "1\r\nx\r\n0\r\n\r\n"sv);
}

TEST(ChunkedBody, CallbackThrows)
{
	StringSink sink;

	EXPECT_THROW(WriteChunkedBody(sink, [](ChunkedWriter &w){
		w.Write("abc"sv);
		throw std::runtime_error("callback failed");
	}), std::runtime_error);

	/* the terminator was sent anyway */
	EXPECT_EQ(sink.GetValue(), "3\r\nabc\r\n0\r\n\r\n"sv);
}

TEST(ChunkedBody, FinishFails)
{
	RecordingSink sink;
	sink.fail_at = 3;

	EXPECT_THROW(WriteChunkedBody(sink, [](ChunkedWriter &w){
		w.Write("abc"sv);
	}), RecordingSinkError);

	EXPECT_EQ(sink.data, "3\r\nabc\r\n"sv);
	EXPECT_EQ(sink.n_flushes, 1U);
}

TEST(ChunkedBody, BothFail)
{
	RecordingSink sink;
	sink.fail_at = 0;

	/* the callback's error wins; the terminator's error is only
	   logged */
	EXPECT_THROW(WriteChunkedBody(sink, [](ChunkedWriter &){
		throw std::invalid_argument("callback failed");
	}), std::invalid_argument);

	EXPECT_EQ(sink.n_writes, 1U);
	EXPECT_TRUE(sink.data.empty());
}
