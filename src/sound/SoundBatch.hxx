// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <string>

struct ConfigData;
class OutputStream;
class VorbisDurationTrace;

struct SoundBatchConfig {
	/**
	 * The directory which is scanned for ".ogg" files.  It is
	 * also written into each "sound[]" path.
	 */
	std::string sounds_folder = "sounds";

	/**
	 * The file which receives the class description.
	 */
	std::string output_file = "description.ext";

	std::string class_name = "CfgSounds";

	double volume = 1.0;
};

/**
 * Throws on error.
 */
SoundBatchConfig
LoadSoundBatchConfig(const ConfigData &config);

struct SoundBatchResult {
	/**
	 * The number of tracks which were written.
	 */
	unsigned n_written = 0;

	/**
	 * The number of files which were skipped because their
	 * duration could not be determined.
	 */
	unsigned n_skipped = 0;
};

/**
 * Scan the sounds folder, determine the duration of each file and
 * write the class description to the given stream.  Files which
 * fail are logged and skipped.
 *
 * Throws if the folder cannot be listed or the output cannot be
 * written.
 */
SoundBatchResult
RunSoundBatch(const SoundBatchConfig &config, OutputStream &os,
	      VorbisDurationTrace *trace=nullptr);

/**
 * Like RunSoundBatch(), but write to SoundBatchConfig::output_file.
 * The file is replaced only if the whole batch succeeds.
 */
SoundBatchResult
WriteSoundBatch(const SoundBatchConfig &config,
		VorbisDurationTrace *trace=nullptr);
