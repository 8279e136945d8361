// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "LogLevel.hxx"

#include <string_view>

struct ConfigData;

/**
 * Throws on error.
 */
LogLevel
ParseLogLevel(std::string_view value);

/**
 * Configure logging before the configuration file has been loaded.
 */
void
LogEarlyInit(bool verbose) noexcept;

/**
 * Configure logging from the configuration file.  The command line
 * flags take precedence over the "log_level" setting.
 *
 * Throws on error.
 */
void
LogInit(const ConfigData &config, bool verbose, bool quiet);
