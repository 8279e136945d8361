// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

struct ConfigData;
class Reader;

/**
 * Parse configuration file contents from a #Reader.
 *
 * Throws on error.
 */
void
ReadConfigFile(ConfigData &data, Reader &reader);

/**
 * Load and parse a configuration file.
 *
 * Throws on error.
 */
void
ReadConfigFile(ConfigData &data, const char *path);
