// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "DirectoryReader.hxx"
#include "lib/fmt/SystemError.hxx"

#include <string_view>

#include <fcntl.h> // for AT_* constants
#include <sys/stat.h>

[[gnu::pure]]
static bool
IsSpecialEntry(std::string_view name) noexcept
{
	return name == "." || name == "..";
}

DirectoryReader::DirectoryReader(const char *path)
	:dirp(opendir(path))
{
	if (dirp == nullptr)
		throw FmtErrno("Failed to open '{}'", path);
}

const char *
DirectoryReader::Next()
{
	while (true) {
		/* readdir() returns nullptr both at the end and on
		   error; only errno tells them apart */
		errno = 0;
		ent = readdir(dirp);
		if (ent == nullptr) {
			if (errno != 0)
				throw MakeErrno("Failed to read directory");
			return nullptr;
		}

		if (!IsSpecialEntry(ent->d_name))
			return ent->d_name;
	}
}

bool
DirectoryReader::IsRegularFile() const noexcept
{
	if (ent == nullptr)
		return false;

	if (ent->d_type == DT_REG)
		return true;

	if (ent->d_type != DT_UNKNOWN && ent->d_type != DT_LNK)
		return false;

	struct stat st;
	return fstatat(dirfd(dirp), ent->d_name, &st, 0) == 0 &&
		S_ISREG(st.st_mode);
}
