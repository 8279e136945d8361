// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "SeekableReader.hxx"
#include "UniqueFileDescriptor.hxx"

/**
 * A #SeekableReader on a local file.  The file is opened by the
 * constructor and closed by the destructor.
 */
class FileReader final : public SeekableReader {
	const UniqueFileDescriptor fd;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit FileReader(const char *path);

	/* virtual methods from class SeekableReader */
	uint_least64_t GetSize() override;
	void Seek(uint_least64_t offset) override;

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};
