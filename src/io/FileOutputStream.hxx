// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "OutputStream.hxx"
#include "UniqueFileDescriptor.hxx"

#include <string>

/**
 * An #OutputStream which replaces a file atomically.  Everything is
 * written to a temporary file (the path with ".tmp" appended) which
 * is renamed by Commit().  Without Commit(), the destructor deletes
 * the temporary file and the destination remains untouched.
 */
class FileOutputStream final : public OutputStream {
	const std::string path, tmp_path;

	UniqueFileDescriptor fd;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit FileOutputStream(std::string _path);

	~FileOutputStream() noexcept override;

	FileOutputStream(const FileOutputStream &) = delete;
	FileOutputStream &operator=(const FileOutputStream &) = delete;

	/* virtual methods from class OutputStream */
	void Write(std::span<const std::byte> src) override;

	/**
	 * Close the temporary file and move it to the destination
	 * path.  May be called only once.
	 *
	 * Throws std::system_error on error.
	 */
	void Commit();
};
