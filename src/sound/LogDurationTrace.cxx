// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogDurationTrace.hxx"
#include "lib/xiph/VorbisIdentification.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

static constexpr Domain vorbis_domain("vorbis");

void
LogDurationTrace::OnVorbisIdentification(const VorbisIdentificationHeader &header) noexcept
{
	FmtDebug(vorbis_domain, "Channels: {}", unsigned(header.channel_count));
	FmtDebug(vorbis_domain, "Sample rate: {} Hz", header.sample_rate);
}

void
LogDurationTrace::OnStreamSize(uint_least64_t size) noexcept
{
	FmtDebug(vorbis_domain, "File size: {} bytes", size);
}

void
LogDurationTrace::OnLastPage(uint_least64_t offset,
			     uint_least64_t granule_position) noexcept
{
	FmtDebug(vorbis_domain, "Last page at offset {}", offset);
	FmtDebug(vorbis_domain, "Final granule position: {}", granule_position);
}

void
LogDurationTrace::OnDuration(double seconds) noexcept
{
	FmtDebug(vorbis_domain, "Calculated duration: {:.2f} seconds", seconds);
}
