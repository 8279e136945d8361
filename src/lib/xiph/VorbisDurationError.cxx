// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "VorbisDurationError.hxx"

#include <fmt/format.h>

const char *
ToString(VorbisDurationError::Kind kind) noexcept
{
	using Kind = VorbisDurationError::Kind;

	switch (kind) {
	case Kind::NOT_OGG:
		return "not_ogg";

	case Kind::HEADER_NOT_FOUND:
		return "header_not_found";

	case Kind::UNSUPPORTED_VERSION:
		return "unsupported_version";

	case Kind::IMPLAUSIBLE_SAMPLE_RATE:
		return "implausible_sample_rate";

	case Kind::NO_PAGE_FOUND:
		return "no_page_found";

	case Kind::TRUNCATED:
		return "truncated";

	case Kind::IO:
		return "io";
	}

	return "unknown";
}

VorbisDurationError
VFmtVorbisDurationError(VorbisDurationError::Kind kind, uint_least64_t value,
			fmt::string_view format_str,
			fmt::format_args args) noexcept
{
	return {kind, fmt::vformat(format_str, args), value};
}
