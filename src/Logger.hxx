// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>

/**
 * Set the global log level.  Messages with a level above this are
 * discarded.  1 = errors, 2 = warnings, 3 = info, 4 = debug,
 * 5 = trace.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

[[gnu::pure]]
inline bool
IsLogLevelVisible(unsigned level) noexcept
{
	return GetLogLevel() >= level;
}

/**
 * Render the message of the given exception, including all nested
 * exceptions.
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;

/**
 * Write one line to stderr, prefixed with the domain.  The log
 * level is not checked.
 */
void
LogWrite(std::string_view domain, std::string_view msg) noexcept;

void
LogVFmt(std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

/**
 * A logger with a fixed domain.
 */
class Logger {
	const std::string_view domain;

public:
	explicit constexpr Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	void operator()(unsigned level, std::string_view msg) const noexcept {
		if (IsLogLevelVisible(level))
			LogWrite(domain, msg);
	}

	void operator()(unsigned level, std::string_view prefix,
			std::exception_ptr ep) const noexcept;

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		if (IsLogLevelVisible(level))
			LogVFmt(domain, format_str,
				fmt::make_format_args(args...));
	}
};
