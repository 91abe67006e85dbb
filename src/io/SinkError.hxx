// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

class SinkError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * A fixed-size sink has no room for the data.
 */
class SinkFullError : public SinkError {
public:
	SinkFullError()
		:SinkError("Sink buffer is full") {}
};

/**
 * The sink accepted zero bytes without reporting an error.
 */
class SinkStalledError : public SinkError {
public:
	SinkStalledError()
		:SinkError("Sink accepted no data") {}
};
