// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "OggPage.hxx"
#include "util/SpanCast.hxx"

#include <string_view>

using std::string_view_literals::operator""sv;

static constexpr std::string_view ogg_capture_pattern = "OggS"sv;

bool
IsOggCapturePattern(std::span<const std::byte> src) noexcept
{
	return ToStringView(src).starts_with(ogg_capture_pattern);
}

std::size_t
FindLastOggCapturePattern(std::span<const std::byte> src) noexcept
{
	return ToStringView(src).rfind(ogg_capture_pattern);
}
