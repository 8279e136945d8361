// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "util/PackedLittleEndian.hxx"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * The fixed part of an Ogg page header.  It is followed by the
 * segment table (#n_segments bytes) and the payload.
 */
struct OggPageHeader {
	/**
	 * "OggS"
	 */
	char capture_pattern[4];

	uint8_t version;

	uint8_t header_type;

	/**
	 * The codec-defined position at the end of this page; for
	 * Vorbis, the number of sample frames.
	 */
	PackedLE64 granule_position;

	PackedLE32 serial_number;
	PackedLE32 sequence_number;
	PackedLE32 checksum;

	uint8_t n_segments;
};

static_assert(sizeof(OggPageHeader) == 27);
static_assert(alignof(OggPageHeader) == 1);

/**
 * Does the buffer begin with the Ogg capture pattern?
 */
[[gnu::pure]]
bool
IsOggCapturePattern(std::span<const std::byte> src) noexcept;

/**
 * Find the rightmost Ogg capture pattern in the buffer.
 *
 * @return the offset of the pattern within the buffer or
 * std::string_view::npos if there is none
 */
[[gnu::pure]]
std::size_t
FindLastOggCapturePattern(std::span<const std::byte> src) noexcept;
