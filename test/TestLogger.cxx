// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(Logger, Level)
{
	const unsigned old = GetLogLevel();

	SetLogLevel(3);
	EXPECT_TRUE(IsLogLevelVisible(1));
	EXPECT_TRUE(IsLogLevelVisible(3));
	EXPECT_FALSE(IsLogLevelVisible(4));

	SetLogLevel(old);
}

TEST(Logger, FullMessage)
{
	try {
		try {
			throw std::runtime_error("inner");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("outer"));
		}
	} catch (...) {
		EXPECT_EQ(GetFullMessage(std::current_exception()),
			  "outer: inner");
	}
}

TEST(Logger, FullMessagePlain)
{
	const auto ep = std::make_exception_ptr(std::logic_error("plain"));
	EXPECT_EQ(GetFullMessage(ep), "plain");
}
