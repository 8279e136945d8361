// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include <sys/types.h>

/**
 * Owns a UNIX file descriptor and closes it in the destructor.
 */
class UniqueFileDescriptor {
	int fd = -1;

public:
	UniqueFileDescriptor() noexcept = default;

	UniqueFileDescriptor(UniqueFileDescriptor &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFileDescriptor() noexcept {
		Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		std::swap(fd, src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Open a file; O_CLOEXEC and O_NOCTTY are added to the
	 * flags.  Any file descriptor owned previously is leaked, so
	 * call this only on an undefined instance.
	 *
	 * @return false on error (with errno set)
	 */
	bool Open(const char *path, int flags, mode_t mode=0666) noexcept;

	/**
	 * Release the file descriptor.
	 *
	 * @return false if there was none or if close() failed
	 */
	bool Close() noexcept;

	/**
	 * Move the file offset to the given absolute position.
	 *
	 * @return false on error
	 */
	bool Seek(off_t offset) const noexcept;

	/**
	 * @return the size of the file in bytes or -1 on error
	 */
	[[gnu::pure]]
	off_t GetSize() const noexcept;

	ssize_t Read(std::span<std::byte> dest) const noexcept;

	ssize_t Write(std::span<const std::byte> src) const noexcept;
};
