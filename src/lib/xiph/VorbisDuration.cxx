// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "VorbisDuration.hxx"
#include "VorbisDurationError.hxx"
#include "VorbisDurationTrace.hxx"
#include "VorbisIdentification.hxx"
#include "OggPage.hxx"
#include "io/SeekableReader.hxx"

#include <algorithm>
#include <array>
#include <memory>
#include <string_view>
#include <system_error>

using Kind = VorbisDurationError::Kind;

static std::size_t
ReadAt(SeekableReader &source, uint_least64_t offset,
       std::span<std::byte> dest)
{
	source.Seek(offset);
	return source.ReadAll(dest);
}

static void
CheckOggSignature(SeekableReader &source)
{
	std::array<std::byte, 4> signature;
	const auto nbytes = ReadAt(source, 0, signature);
	if (!IsOggCapturePattern(std::span{signature}.first(nbytes)))
		throw VorbisDurationError{Kind::NOT_OGG,
			"Not a valid Ogg file"};
}

static VorbisIdentificationHeader
ReadVorbisIdentification(SeekableReader &source)
{
	std::array<std::byte, VORBIS_HEADER_WINDOW> buffer;
	const auto nbytes = ReadAt(source, 0, buffer);
	return ScanVorbisIdentification(std::span{buffer}.first(nbytes));
}

/**
 * Locate the last Ogg page in the tail window and return its granule
 * position.
 */
static uint_least64_t
ReadLastGranulePosition(SeekableReader &source, VorbisDurationTrace *trace)
{
	const uint_least64_t size = source.GetSize();
	if (trace != nullptr)
		trace->OnStreamSize(size);

	const std::size_t tail_size =
		std::min<uint_least64_t>(size, OGG_TAIL_WINDOW);
	const uint_least64_t tail_offset = size - tail_size;

	const auto buffer = std::make_unique<std::byte[]>(tail_size);
	const std::span tail{buffer.get(), tail_size};

	const auto nbytes = ReadAt(source, tail_offset, tail);
	if (nbytes < tail_size)
		throw VorbisDurationError{Kind::TRUNCATED,
			"Stream ended before its declared size"};

	const auto position = FindLastOggCapturePattern(tail);
	if (position == std::string_view::npos)
		throw FmtVorbisDurationError(Kind::NO_PAGE_FOUND, 0,
					     "No Ogg page found in the last {} bytes",
					     tail_size);

	const auto page = tail.subspan(position);
	if (page.size() < sizeof(OggPageHeader))
		throw VorbisDurationError{Kind::TRUNCATED,
			"Last Ogg page header is truncated"};

	const auto &header = *reinterpret_cast<const OggPageHeader *>(page.data());
	const uint_least64_t granule_position = header.granule_position;

	if (trace != nullptr)
		trace->OnLastPage(tail_offset + position, granule_position);

	return granule_position;
}

double
ComputeVorbisDuration(SeekableReader &source, VorbisDurationTrace *trace)
try {
	CheckOggSignature(source);

	const auto header = ReadVorbisIdentification(source);
	if (trace != nullptr)
		trace->OnVorbisIdentification(header);

	const auto granule_position = ReadLastGranulePosition(source, trace);

	const double duration = double(granule_position) / double(header.sample_rate);
	if (trace != nullptr)
		trace->OnDuration(duration);

	return duration;
} catch (const std::system_error &) {
	std::throw_with_nested(VorbisDurationError{Kind::IO,
			"Failed to read the stream"});
}
