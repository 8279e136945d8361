// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "VorbisIdentification.hxx"
#include "VorbisDurationError.hxx"
#include "util/PackedLittleEndian.hxx"
#include "util/SpanCast.hxx"

#include <string_view>

using std::string_view_literals::operator""sv;

/**
 * The packet type (1 = identification) and the codec signature.
 */
static constexpr std::string_view vorbis_identification_marker = "\x01vorbis"sv;

/**
 * The beginning of the identification header body; the bitrate,
 * blocksize and framing fields which follow are not needed.
 */
struct VorbisIdentificationBody {
	PackedLE32 version;
	uint8_t channels;
	PackedLE32 sample_rate;
};

static_assert(sizeof(VorbisIdentificationBody) == 9);
static_assert(alignof(VorbisIdentificationBody) == 1);

VorbisIdentificationHeader
ScanVorbisIdentification(std::span<const std::byte> src)
{
	using Kind = VorbisDurationError::Kind;

	const auto position = ToStringView(src).find(vorbis_identification_marker);
	if (position == std::string_view::npos)
		throw VorbisDurationError{Kind::HEADER_NOT_FOUND,
			"Could not find Vorbis identification header"};

	const auto rest = src.subspan(position + vorbis_identification_marker.size());
	if (rest.size() < sizeof(VorbisIdentificationBody))
		throw VorbisDurationError{Kind::TRUNCATED,
			"Vorbis identification header is truncated"};

	const auto &body = *reinterpret_cast<const VorbisIdentificationBody *>(rest.data());

	const VorbisIdentificationHeader header{
		body.version,
		body.channels,
		body.sample_rate,
	};

	if (header.vorbis_version != 0)
		throw FmtVorbisDurationError(Kind::UNSUPPORTED_VERSION,
					     header.vorbis_version,
					     "Unsupported Vorbis version: {}",
					     header.vorbis_version);

	if (header.sample_rate < VORBIS_MIN_SAMPLE_RATE ||
	    header.sample_rate > VORBIS_MAX_SAMPLE_RATE)
		throw FmtVorbisDurationError(Kind::IMPLAUSIBLE_SAMPLE_RATE,
					     header.sample_rate,
					     "Invalid sample rate: {}",
					     header.sample_rate);

	return header;
}
