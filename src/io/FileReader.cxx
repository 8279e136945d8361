// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "FileReader.hxx"
#include "Open.hxx"
#include "system/Error.hxx"

FileReader::FileReader(const char *path)
	:fd(OpenReadOnly(path))
{
}

uint_least64_t
FileReader::GetSize()
{
	const off_t size = fd.GetSize();
	if (size < 0)
		throw MakeErrno("Failed to get file size");

	return size;
}

void
FileReader::Seek(uint_least64_t offset)
{
	if (!fd.Seek(offset))
		throw MakeErrno("Failed to seek");
}

std::size_t
FileReader::Read(std::span<std::byte> dest)
{
	const ssize_t nbytes = fd.Read(dest);
	if (nbytes < 0)
		throw MakeErrno("Failed to read from file");

	return nbytes;
}
