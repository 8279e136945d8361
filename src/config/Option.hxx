// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <string_view>

enum class ConfigOption {
	SOUNDS_FOLDER,
	OUTPUT_FILE,
	CLASS_NAME,
	VOLUME,
	LOG_LEVEL,
	LOG_TIMESTAMP,
	MAX
};

/**
 * @return #ConfigOption::MAX if not found
 */
[[gnu::pure]]
ConfigOption
ParseConfigOptionName(std::string_view name) noexcept;

/**
 * The name of the option in the configuration file.
 */
[[gnu::const]]
const char *
GetConfigOptionName(ConfigOption option) noexcept;
