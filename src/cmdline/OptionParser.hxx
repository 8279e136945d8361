// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "OptionDef.hxx"

#include <span>
#include <vector>

/**
 * Command line option parser.
 *
 * Long options take their value either after "=" or in the next
 * argument.  Short options may be grouped ("-vq"); if one of them
 * takes a value, the rest of the group is the value ("-cfile"),
 * or the next argument if nothing follows.  Everything after "--"
 * is treated as a non-option argument, and so is a single "-".
 */
class OptionParser {
	const std::span<const OptionDef> options;

	std::span<const char *const> args;

	/**
	 * The unparsed rest of a group of short options.
	 */
	const char *pending_short = nullptr;

	bool end_of_options = false;

	std::vector<const char *> remaining;

public:
	OptionParser(std::span<const OptionDef> _options,
		     int argc, const char *const*argv) noexcept
		:options(_options), args(argv + 1, argc - 1) {}

	struct Result {
		/**
		 * The index into the #OptionDef array or -1 if there
		 * are no more options.
		 */
		int index;

		const char *value;

		constexpr operator bool() const noexcept {
			return index >= 0;
		}
	};

	/**
	 * Parse the next option.  Non-option arguments are skipped
	 * and collected for GetRemaining().
	 *
	 * Throws on error.
	 */
	Result Next();

	/**
	 * Returns the non-option arguments seen so far, in their
	 * original order.
	 */
	std::span<const char *const> GetRemaining() const noexcept {
		return remaining;
	}

private:
	const char *Shift() noexcept;
	const char *ShiftValue(const char *option);
	Result ParseLongOption(const char *arg);
	Result ParseShortOption();
};
