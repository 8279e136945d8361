// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "UniqueFileDescriptor.hxx"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

bool
UniqueFileDescriptor::Open(const char *path, int flags, mode_t mode) noexcept
{
	fd = ::open(path, flags | O_NOCTTY | O_CLOEXEC, mode);
	return IsDefined();
}

bool
UniqueFileDescriptor::Close() noexcept
{
	if (!IsDefined())
		return false;

	return ::close(std::exchange(fd, -1)) == 0;
}

bool
UniqueFileDescriptor::Seek(off_t offset) const noexcept
{
	return ::lseek(fd, offset, SEEK_SET) >= 0;
}

off_t
UniqueFileDescriptor::GetSize() const noexcept
{
	struct stat st;
	if (::fstat(fd, &st) < 0)
		return -1;

	return st.st_size;
}

ssize_t
UniqueFileDescriptor::Read(std::span<std::byte> dest) const noexcept
{
	return ::read(fd, dest.data(), dest.size());
}

ssize_t
UniqueFileDescriptor::Write(std::span<const std::byte> src) const noexcept
{
	return ::write(fd, src.data(), src.size());
}
