// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <fmt/core.h>
#if FMT_VERSION >= 80000 && FMT_VERSION < 90000
#include <fmt/format.h>
#endif

#include <string_view>

class OutputStream;

/**
 * Generates a "CfgSounds" class description which declares one
 * class per sound file:
 *
 *     class CfgSounds
 *     {
 *         tracks[]={};
 *
 *         class track_name
 *         {
 *             name = "track_name";
 *             sound[] = {"\sounds\track name.ogg", 12.5, 1.0};
 *             titles[] = {};
 *         };
 *     };
 */
class CfgSoundsWriter {
	OutputStream &os;

	/**
	 * The folder name written into each "sound[]" path.
	 */
	const std::string_view sounds_folder;

	const double volume;

	unsigned n_tracks = 0;

public:
	CfgSoundsWriter(OutputStream &_os, std::string_view _sounds_folder,
			double _volume) noexcept
		:os(_os), sounds_folder(_sounds_folder), volume(_volume) {}

	CfgSoundsWriter(const CfgSoundsWriter &) = delete;
	CfgSoundsWriter &operator=(const CfgSoundsWriter &) = delete;

	unsigned GetTrackCount() const noexcept {
		return n_tracks;
	}

	/**
	 * Throws on I/O error.
	 */
	void Begin(std::string_view class_name);

	/**
	 * Throws on I/O error.
	 *
	 * @param file_name the name of the file inside the sounds
	 * folder
	 * @param duration the duration in seconds
	 */
	void AddTrack(std::string_view file_name, double duration);

	/**
	 * Throws on I/O error.
	 */
	void End();

private:
	void VFmt(fmt::string_view format_str, fmt::format_args args);

	template<typename S, typename... Args>
	void Fmt(const S &format_str, Args&&... args) {
#if FMT_VERSION >= 90000
		VFmt(format_str,
		     fmt::make_format_args(args...));
#else
		VFmt(fmt::to_string_view(format_str),
		     fmt::make_args_checked<Args...>(format_str,
						     args...));
#endif
	}
};
