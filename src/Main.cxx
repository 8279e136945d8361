// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CommandLine.hxx"
#include "LogInit.hxx"
#include "LogBackend.hxx"
#include "Log.hxx"
#include "config/Data.hxx"
#include "lib/xiph/VorbisDuration.hxx"
#include "io/FileReader.hxx"
#include "sound/SoundBatch.hxx"
#include "sound/FormatDecimal.hxx"
#include "sound/LogDurationTrace.hxx"
#include "util/Domain.hxx"

#include <fmt/core.h>

#include <cstdlib>

static constexpr Domain main_domain("main");

/**
 * Print the duration of each file.  Files which fail are logged and
 * skipped.
 *
 * @return true if all files succeeded
 */
static bool
PrintDurations(const std::vector<const char *> &files,
	       VorbisDurationTrace *trace)
{
	bool success = true;

	for (const char *path : files) {
		try {
			FileReader reader(path);
			const double duration = ComputeVorbisDuration(reader, trace);
			fmt::print("{} {}\n", FormatDecimal(duration), path);
		} catch (...) {
			LogError(std::current_exception(), path);
			success = false;
		}
	}

	return success;
}

int
main(int argc, char **argv) noexcept
try {
	CommandLineOptions options;
	ConfigData config;
	ParseCommandLine(argc, argv, options, config);

	LogInit(config, options.verbose, options.quiet);

	LogDurationTrace log_trace;
	VorbisDurationTrace *const trace = IsLogEnabled(LogLevel::DEBUG)
		? &log_trace
		: nullptr;

	if (!options.files.empty())
		return PrintDurations(options.files, trace)
			? EXIT_SUCCESS
			: EXIT_FAILURE;

	const auto batch_config = LoadSoundBatchConfig(config);
	const auto result = WriteSoundBatch(batch_config, trace);

	FmtNotice(main_domain, "File '{}' has been created successfully.",
		  batch_config.output_file);
	FmtInfo(main_domain, "{} tracks written, {} files skipped",
		result.n_written, result.n_skipped);

	return EXIT_SUCCESS;
} catch (...) {
	LogError(std::current_exception());
	return EXIT_FAILURE;
}
