// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CommandLine.hxx"
#include "LogInit.hxx"
#include "Log.hxx"
#include "config/Data.hxx"
#include "config/File.hxx"
#include "config/Option.hxx"
#include "cmdline/OptionDef.hxx"
#include "cmdline/OptionParser.hxx"
#include "util/Domain.hxx"
#include "config.h"

#include <fmt/core.h>

#include <cstdlib>

enum Option {
	OPTION_CONFIG,
	OPTION_SOUNDS,
	OPTION_OUTPUT,
	OPTION_VERBOSE,
	OPTION_QUIET,
	OPTION_VERSION,
	OPTION_HELP,
	OPTION_HELP2,
};

static constexpr OptionDef option_defs[] = {
	{"config", 'c', true, "read settings from this configuration file"},
	{"sounds", 's', true, "the folder containing the .ogg files"},
	{"output", 'o', true, "the file to be generated"},
	{"verbose", 'v', "verbose logging"},
	{"quiet", 'q', "log only warnings and errors"},
	{"version", 'V', "print version number"},
	{"help", 'h', "show help options"},
	{nullptr, '?', nullptr}, // hidden, standard alias for --help
};

static constexpr Domain cmdline_domain("cmdline");

[[noreturn]]
static void version()
{
	fmt::print("{} {}\n"
		   "\n"
		   "Determines the duration of Ogg/Vorbis files and generates\n"
		   "a CfgSounds class description.\n",
		   PACKAGE, VERSION);

	std::exit(EXIT_SUCCESS);
}

static void PrintOption(const OptionDef &opt)
{
	const auto name = fmt::format("{}{}", opt.long_option,
				      opt.has_value ? "=VALUE" : "");

	if (opt.HasShortOption())
		fmt::print("  -{}, --{:<16}{}\n",
			   opt.short_option, name, opt.description);
	else
		fmt::print("  --{:<20}{}\n", name, opt.description);
}

[[noreturn]]
static void help()
{
	fmt::print("Usage:\n"
		   "  {} [OPTION...] [FILE.ogg...]\n"
		   "\n"
		   "Without FILE arguments, all .ogg files in the sounds folder\n"
		   "are processed and the class description is written to the\n"
		   "output file.  With FILE arguments, their durations are\n"
		   "printed in seconds.\n"
		   "\n"
		   "Options:\n",
		   PACKAGE);

	for (const auto &i : option_defs)
		if (i.HasDescription()) // hide hidden options from help print
			PrintOption(i);

	std::exit(EXIT_SUCCESS);
}

void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config)
{
	const char *config_file = nullptr;
	const char *sounds_folder = nullptr;
	const char *output_file = nullptr;

	OptionParser parser(option_defs, argc, argv);
	while (auto o = parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_CONFIG:
			config_file = o.value;
			break;

		case OPTION_SOUNDS:
			sounds_folder = o.value;
			break;

		case OPTION_OUTPUT:
			output_file = o.value;
			break;

		case OPTION_VERBOSE:
			options.verbose = true;
			break;

		case OPTION_QUIET:
			options.quiet = true;
			break;

		case OPTION_VERSION:
			version();

		case OPTION_HELP:
		case OPTION_HELP2:
			help();
		}
	}

	/* initialize the logging library, so the configuration file
	   parser can use it already */
	LogEarlyInit(options.verbose);

	for (const char *i : parser.GetRemaining())
		options.files.push_back(i);

	if (config_file != nullptr)
		ReadConfigFile(config, config_file);
	else
		LogDebug(cmdline_domain, "No configuration file, using defaults");

	if (sounds_folder != nullptr)
		config.SetParam(ConfigOption::SOUNDS_FOLDER,
				ConfigParam(sounds_folder));

	if (output_file != nullptr)
		config.SetParam(ConfigOption::OUTPUT_FILE,
				ConfigParam(output_file));
}
