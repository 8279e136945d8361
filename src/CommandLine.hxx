// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <vector>

struct ConfigData;

struct CommandLineOptions {
	bool verbose = false;
	bool quiet = false;

	/**
	 * Files whose duration shall be printed.  If this is empty,
	 * the sounds folder is processed.
	 */
	std::vector<const char *> files;
};

/**
 * Parse the command line, load the configuration file (if one was
 * specified) and apply command line overrides to #config.
 *
 * Throws on error.
 */
void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config);
