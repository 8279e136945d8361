// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * Does the file name have the ".ogg" suffix (case-sensitive)?
 */
[[gnu::pure]]
bool
IsSoundFileName(std::string_view name) noexcept;

/**
 * List the names (not paths) of all regular ".ogg" files in the
 * given directory, sorted by name.  Symbolic links to regular files
 * are included.
 *
 * Throws std::system_error on error.
 */
std::vector<std::string>
ListSoundFiles(const char *directory);

/**
 * Derive a class name from a sound file name: the extension is
 * removed, and spaces are replaced with underscores.
 */
[[gnu::pure]]
std::string
MakeTrackName(std::string_view file_name) noexcept;
