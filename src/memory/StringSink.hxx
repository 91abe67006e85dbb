// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Sink.hxx"
#include "memory/ByteView.hxx"

#include <string>
#include <string_view>

/**
 * A #Sink which appends everything to a growing std::string.
 */
class StringSink final : public Sink {
	std::string value;

public:
	StringSink() = default;

	std::string_view GetValue() const noexcept {
		return value;
	}

	std::string Steal() noexcept {
		return std::move(value);
	}

	void Clear() noexcept {
		value.clear();
	}

	/* virtual methods from class Sink */
	std::size_t WriteSome(std::span<const std::byte> src) override {
		value.append(ToCharView(src));
		return src.size();
	}
};
