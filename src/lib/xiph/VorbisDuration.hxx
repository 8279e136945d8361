// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstddef>

class SeekableReader;
class VorbisDurationTrace;

/**
 * The number of bytes at the beginning of the stream which are
 * searched for the Vorbis identification header.
 */
static constexpr std::size_t VORBIS_HEADER_WINDOW = 8192;

/**
 * The number of bytes at the end of the stream which are searched
 * for the last Ogg page.  A file whose last page begins earlier is
 * not supported.
 */
static constexpr std::size_t OGG_TAIL_WINDOW = 65536;

/**
 * Determine the playback duration of an Ogg/Vorbis stream by
 * parsing its headers, without decoding.
 *
 * The sample rate is obtained from the Vorbis identification header
 * near the beginning, and the total number of samples from the
 * granule position of the last Ogg page.  Encoder pre-skip is not
 * compensated, and chained or multiplexed streams are not
 * supported.
 *
 * The reader's position is undefined afterwards.  Each call needs
 * its own #SeekableReader; there is no other shared state.
 *
 * Throws #VorbisDurationError on error.
 *
 * @param trace an optional observer for diagnostics
 * @return the duration in seconds
 */
double
ComputeVorbisDuration(SeekableReader &source,
		      VorbisDurationTrace *trace=nullptr);
