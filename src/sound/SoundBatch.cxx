// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SoundBatch.hxx"
#include "SoundScan.hxx"
#include "CfgSoundsWriter.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "lib/xiph/VorbisDuration.hxx"
#include "lib/xiph/VorbisDurationError.hxx"
#include "io/FileReader.hxx"
#include "io/FileOutputStream.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"
#include "Log.hxx"

#include <optional>

static constexpr Domain sound_domain("sound");

SoundBatchConfig
LoadSoundBatchConfig(const ConfigData &config)
{
	SoundBatchConfig result;

	if (const char *s = config.GetString(ConfigOption::SOUNDS_FOLDER))
		result.sounds_folder = s;

	if (const char *s = config.GetString(ConfigOption::OUTPUT_FILE))
		result.output_file = s;

	if (const char *s = config.GetString(ConfigOption::CLASS_NAME))
		result.class_name = s;

	result.volume = config.GetDouble(ConfigOption::VOLUME, result.volume);

	return result;
}

/**
 * Determine the duration of one sound file.  Errors are logged.
 *
 * @return the duration in seconds or std::nullopt if the file shall
 * be skipped
 */
static std::optional<double>
LoadSoundDuration(const std::string &path, const std::string &name,
		  VorbisDurationTrace *trace) noexcept
{
	FmtDebug(sound_domain, "Processing {}", path);

	try {
		FileReader reader(path.c_str());
		return ComputeVorbisDuration(reader, trace);
	} catch (const VorbisDurationError &e) {
		FmtWarning(sound_domain, "Skipping file {} due to error ({}): {}",
			   name, ToString(e.GetKind()), GetFullMessage(e));
	} catch (...) {
		FmtWarning(sound_domain, "Skipping file {} due to error: {}",
			   name, GetFullMessage(std::current_exception()));
	}

	return std::nullopt;
}

SoundBatchResult
RunSoundBatch(const SoundBatchConfig &config, OutputStream &os,
	      VorbisDurationTrace *trace)
{
	const auto files = ListSoundFiles(config.sounds_folder.c_str());
	FmtDebug(sound_domain, "Found {} sound files in {}",
		 files.size(), config.sounds_folder);

	SoundBatchResult result;

	CfgSoundsWriter writer(os, config.sounds_folder, config.volume);
	writer.Begin(config.class_name);

	for (const auto &name : files) {
		const auto path = config.sounds_folder + "/" + name;
		const auto duration = LoadSoundDuration(path, name, trace);
		if (!duration) {
			++result.n_skipped;
			continue;
		}

		writer.AddTrack(name, *duration);
	}

	writer.End();

	result.n_written = writer.GetTrackCount();
	return result;
}

SoundBatchResult
WriteSoundBatch(const SoundBatchConfig &config, VorbisDurationTrace *trace)
{
	FileOutputStream file(config.output_file);
	const auto result = RunSoundBatch(config, file, trace);
	file.Commit();
	return result;
}
