// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <concepts>
#include <string>

/**
 * A configured value together with its origin, which is used in
 * error messages.
 */
struct ConfigParam {
	std::string value;

	/**
	 * The line in the configuration file, or 0 if the value was
	 * specified on the command line.
	 */
	unsigned line;

	explicit ConfigParam(std::string _value, unsigned _line=0) noexcept
		:value(std::move(_value)), line(_line) {}

	bool IsFromCommandLine() const noexcept {
		return line == 0;
	}

	/**
	 * Call this in a "catch" block to throw a nested exception
	 * which names the origin of this value.
	 */
	[[noreturn]]
	void ThrowWithNested() const;

	/**
	 * Invoke a function with the value; if it throws, the error
	 * is wrapped by ThrowWithNested().
	 */
	template<std::regular_invocable<const char *> F>
	auto With(F &&f) const {
		try {
			return f(value.c_str());
		} catch (...) {
			ThrowWithNested();
		}
	}
};
