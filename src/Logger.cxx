// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <fmt/format.h>

#include <iterator>
#include <stdexcept>

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

unsigned
GetLogLevel() noexcept
{
	return log_level;
}

static void
AppendMessage(std::string &result, const std::exception &e) noexcept
{
	if (!result.empty())
		result.append(": ");
	result.append(e.what());

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		AppendMessage(result, nested);
	} catch (...) {
		result.append(": Unrecognized nested exception");
	}
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	std::string result;

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		AppendMessage(result, e);
	} catch (const char *s) {
		result = s;
	} catch (...) {
		result = "Unrecognized exception";
	}

	return result;
}

void
LogWrite(std::string_view domain, std::string_view msg) noexcept
{
	fmt::memory_buffer buffer;
	fmt::format_to(std::back_inserter(buffer), "{}: {}\n", domain, msg);
	fwrite(buffer.data(), 1, buffer.size(), stderr);
}

void
LogVFmt(std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	LogWrite(domain, {buffer.data(), buffer.size()});
}

void
Logger::operator()(unsigned level, std::string_view prefix,
		   std::exception_ptr ep) const noexcept
{
	if (!IsLogLevelVisible(level))
		return;

	const std::string msg = GetFullMessage(ep);
	LogVFmt(domain, "{}: {}", fmt::make_format_args(prefix, msg));
}
