// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "SeekableReader.hxx"

#include <algorithm>

/**
 * A #SeekableReader on a buffer in memory.  The caller owns the
 * buffer and must keep it alive while this object is in use.
 */
class MemoryReader final : public SeekableReader {
	std::span<const std::byte> buffer;

	std::size_t position = 0;

public:
	explicit constexpr MemoryReader(std::span<const std::byte> _buffer) noexcept
		:buffer(_buffer) {}

	/* virtual methods from class SeekableReader */
	uint_least64_t GetSize() noexcept override {
		return buffer.size();
	}

	void Seek(uint_least64_t offset) noexcept override {
		position = std::min<uint_least64_t>(offset, buffer.size());
	}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) noexcept override {
		const auto src = buffer.subspan(position);
		const std::size_t nbytes = std::min(dest.size(), src.size());
		std::copy_n(src.begin(), nbytes, dest.begin());
		position += nbytes;
		return nbytes;
	}
};
