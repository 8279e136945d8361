// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CfgSoundsWriter.hxx"
#include "FormatDecimal.hxx"
#include "SoundScan.hxx"
#include "io/OutputStream.hxx"

#include <fmt/format.h>

#include <iterator> // for std::back_inserter()

void
CfgSoundsWriter::VFmt(fmt::string_view format_str, fmt::format_args args)
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	os.Write(std::as_bytes(std::span{buffer.data(), buffer.size()}));
}

void
CfgSoundsWriter::Begin(std::string_view class_name)
{
	Fmt("class {}\n"
	    "{{\n"
	    "    tracks[]={{}};\n",
	    class_name);
}

void
CfgSoundsWriter::AddTrack(std::string_view file_name, double duration)
{
	const auto track_name = MakeTrackName(file_name);
	const auto duration_s = FormatDecimal(duration);
	const auto volume_s = FormatDecimal(volume);

	Fmt("\n"
	    "    class {0}\n"
	    "    {{\n"
	    "        name = \"{0}\";\n"
	    "        sound[] = {{\"\\{1}\\{2}\", {3}, {4}}};\n"
	    "        titles[] = {{}};\n"
	    "    }};\n",
	    track_name, sounds_folder, file_name,
	    duration_s, volume_s);

	++n_tracks;
}

void
CfgSoundsWriter::End()
{
	Fmt("}};\n");
}
