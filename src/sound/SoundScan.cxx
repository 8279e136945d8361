// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SoundScan.hxx"
#include "fs/DirectoryReader.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

bool
IsSoundFileName(std::string_view name) noexcept
{
	return name.ends_with(".ogg"sv);
}

std::vector<std::string>
ListSoundFiles(const char *directory)
{
	std::vector<std::string> result;

	DirectoryReader reader(directory);
	while (const char *name = reader.Next())
		if (IsSoundFileName(name) && reader.IsRegularFile())
			result.emplace_back(name);

	std::sort(result.begin(), result.end());
	return result;
}

/**
 * Strip the last extension.  Leading dots (hidden files) do not
 * start an extension.
 */
static std::string_view
StripExtension(std::string_view name) noexcept
{
	const auto dot = name.rfind('.');
	if (dot == name.npos ||
	    name.find_first_not_of('.') >= dot)
		return name;

	return name.substr(0, dot);
}

std::string
MakeTrackName(std::string_view file_name) noexcept
{
	std::string result{StripExtension(file_name)};
	std::replace(result.begin(), result.end(), ' ', '_');
	return result;
}
