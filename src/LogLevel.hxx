// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstdint>

/**
 * Message severities in ascending order.  The backend drops
 * everything below the configured threshold.
 */
enum class LogLevel : uint8_t {
	/**
	 * Tracing output, e.g. the values parsed from each Ogg
	 * stream.
	 */
	DEBUG,

	/**
	 * Progress and statistics.
	 */
	INFO,

	/**
	 * The result of an operation (the default threshold).
	 */
	NOTICE,

	/**
	 * A problem which was handled, e.g. a sound file which was
	 * skipped.
	 */
	WARNING,

	ERROR,
};
