// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <fmt/core.h>
#if FMT_VERSION >= 80000 && FMT_VERSION < 90000
#include <fmt/format.h>
#endif

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * Thrown by ComputeVorbisDuration() when the duration of a stream
 * cannot be determined.  None of these errors is fatal; the caller
 * may continue with the next stream.
 */
class VorbisDurationError : public std::runtime_error {
public:
	enum class Kind : uint8_t {
		/**
		 * The stream does not begin with the "OggS" capture
		 * pattern.
		 */
		NOT_OGG,

		/**
		 * No Vorbis identification header was found near the
		 * beginning of the stream.
		 */
		HEADER_NOT_FOUND,

		/**
		 * The identification header declares a Vorbis version
		 * other than 0.  GetValue() returns the version.
		 */
		UNSUPPORTED_VERSION,

		/**
		 * The sample rate is outside the plausible range.
		 * GetValue() returns the sample rate.
		 */
		IMPLAUSIBLE_SAMPLE_RATE,

		/**
		 * No "OggS" capture pattern was found near the end of
		 * the stream.
		 */
		NO_PAGE_FOUND,

		/**
		 * The stream ended before a structure was complete.
		 */
		TRUNCATED,

		/**
		 * Reading from or seeking in the source failed.  The
		 * original std::system_error is nested.
		 */
		IO,
	};

private:
	Kind kind;

	uint_least64_t value;

public:
	VorbisDurationError(Kind _kind, const char *_msg,
			    uint_least64_t _value=0) noexcept
		:std::runtime_error(_msg), kind(_kind), value(_value) {}

	VorbisDurationError(Kind _kind, const std::string &_msg,
			    uint_least64_t _value=0) noexcept
		:std::runtime_error(_msg), kind(_kind), value(_value) {}

	Kind GetKind() const noexcept {
		return kind;
	}

	/**
	 * The offending value for #UNSUPPORTED_VERSION and
	 * #IMPLAUSIBLE_SAMPLE_RATE, 0 otherwise.
	 */
	uint_least64_t GetValue() const noexcept {
		return value;
	}
};

/**
 * Returns a short identifier for the error kind, e.g. for log
 * messages.
 */
[[gnu::const]]
const char *
ToString(VorbisDurationError::Kind kind) noexcept;

[[nodiscard]]
VorbisDurationError
VFmtVorbisDurationError(VorbisDurationError::Kind kind, uint_least64_t value,
			fmt::string_view format_str,
			fmt::format_args args) noexcept;

/**
 * Construct a #VorbisDurationError carrying the given value, with a
 * message formatted by libfmt.
 */
template<typename S, typename... Args>
[[nodiscard]]
VorbisDurationError
FmtVorbisDurationError(VorbisDurationError::Kind kind, uint_least64_t value,
		       const S &format_str, Args&&... args) noexcept
{
#if FMT_VERSION >= 90000
	return VFmtVorbisDurationError(kind, value, format_str,
				       fmt::make_format_args(args...));
#else
	return VFmtVorbisDurationError(kind, value,
				       fmt::to_string_view(format_str),
				       fmt::make_args_checked<Args...>(format_str,
								       args...));
#endif
}
