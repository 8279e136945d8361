// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * The fields of the Vorbis identification header which are needed
 * to calculate the duration of a stream.
 */
struct VorbisIdentificationHeader {
	uint32_t vorbis_version;
	uint8_t channel_count;
	uint32_t sample_rate;
};

/**
 * Sample rates outside of this range are rejected.  Vorbis itself
 * has no such limit; this is a sanity check which catches false
 * positives of ScanVorbisIdentification().
 */
static constexpr uint32_t VORBIS_MIN_SAMPLE_RATE = 8000;
static constexpr uint32_t VORBIS_MAX_SAMPLE_RATE = 192000;

/**
 * Search the buffer for the first Vorbis identification header (the
 * packet type byte 0x01 followed by "vorbis") and parse its
 * version, channel count and sample rate.
 *
 * This is a plain byte search which does not respect Ogg page
 * boundaries; payload data which happens to contain the marker is
 * misinterpreted.
 *
 * Throws #VorbisDurationError if no header was found, if it is
 * truncated, if the version is not 0 or if the sample rate is not
 * plausible.
 */
VorbisIdentificationHeader
ScanVorbisIdentification(std::span<const std::byte> src);
