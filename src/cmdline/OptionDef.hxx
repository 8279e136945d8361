// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

/**
 * Describes one command line option.  An option without a
 * description is accepted but not listed by --help.
 */
struct OptionDef {
	const char *long_option;
	char short_option;
	bool has_value;
	const char *description;

	constexpr OptionDef(const char *_long_option, char _short_option,
			    const char *_description) noexcept
		:OptionDef(_long_option, _short_option, false, _description) {}

	constexpr OptionDef(const char *_long_option, char _short_option,
			    bool _has_value, const char *_description) noexcept
		:long_option(_long_option), short_option(_short_option),
		 has_value(_has_value), description(_description) {}

	constexpr bool HasLongOption() const noexcept {
		return long_option != nullptr;
	}

	constexpr bool HasShortOption() const noexcept {
		return short_option != 0;
	}

	constexpr bool HasDescription() const noexcept {
		return description != nullptr;
	}
};
