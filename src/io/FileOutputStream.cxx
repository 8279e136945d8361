// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "FileOutputStream.hxx"
#include "Open.hxx"
#include "lib/fmt/SystemError.hxx"

#include <stdio.h> // for rename()
#include <unistd.h> // for unlink()

FileOutputStream::FileOutputStream(std::string _path)
	:path(std::move(_path)),
	 tmp_path(path + ".tmp"),
	 fd(CreateTruncate(tmp_path.c_str()))
{
}

FileOutputStream::~FileOutputStream() noexcept
{
	if (fd.IsDefined()) {
		/* not committed: roll back */
		fd.Close();
		unlink(tmp_path.c_str());
	}
}

void
FileOutputStream::Write(std::span<const std::byte> src)
{
	while (!src.empty()) {
		const ssize_t nbytes = fd.Write(src);
		if (nbytes < 0)
			throw FmtErrno("Failed to write to '{}'", tmp_path);

		src = src.subspan(nbytes);
	}
}

void
FileOutputStream::Commit()
{
	if (!fd.Close() || rename(tmp_path.c_str(), path.c_str()) < 0) {
		const int e = errno;
		unlink(tmp_path.c_str());
		throw FmtErrno(e, "Failed to commit '{}'", path);
	}
}
