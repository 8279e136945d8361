// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Reader.hxx"

#include <cstdint>

/**
 * A #Reader which allows random access: its total size is known and
 * the read position can be moved to any absolute offset.
 *
 * An instance has a single read cursor; it must not be used by more
 * than one thread at a time.
 */
class SeekableReader : public Reader {
public:
	/**
	 * Determine the total size of the stream in bytes.
	 *
	 * Throws on error.
	 */
	virtual uint_least64_t GetSize() = 0;

	/**
	 * Move the read position to the given absolute offset.  Seeking
	 * beyond the end is allowed; a subsequent Read() returns 0.
	 *
	 * Throws on error.
	 */
	virtual void Seek(uint_least64_t offset) = 0;

	void Rewind() {
		Seek(0);
	}
};
