// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>

/**
 * An interface that can read bytes from a stream until the stream
 * ends.
 */
class Reader {
public:
	Reader() = default;
	Reader(const Reader &) = delete;

	virtual ~Reader() noexcept = default;

	/**
	 * Read data from the stream.
	 *
	 * Throws on error.
	 *
	 * @return the number of bytes read into the given buffer or 0
	 * on end-of-stream
	 */
	virtual std::size_t Read(std::span<std::byte> dest) = 0;

	/**
	 * Read until the buffer is full or the stream ends.
	 *
	 * @return the number of bytes read; less than the buffer size
	 * only at end-of-stream
	 */
	std::size_t ReadAll(std::span<std::byte> dest);
};
