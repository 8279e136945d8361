// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <dirent.h>

/**
 * Iterates over the entries of a directory.  The special entries "."
 * and ".." are skipped.
 */
class DirectoryReader {
	DIR *const dirp;

	const struct dirent *ent = nullptr;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit DirectoryReader(const char *path);

	DirectoryReader(const DirectoryReader &other) = delete;
	DirectoryReader &operator=(const DirectoryReader &other) = delete;

	~DirectoryReader() noexcept {
		closedir(dirp);
	}

	/**
	 * Read the next entry.
	 *
	 * Throws std::system_error on error.
	 *
	 * @return the entry name (valid until the next call) or
	 * nullptr after the last entry
	 */
	const char *Next();

	/**
	 * Is the entry most recently returned by Next() a regular
	 * file?  Symbolic links are followed.  Returns false if the
	 * entry cannot be inspected.
	 */
	bool IsRegularFile() const noexcept;
};
