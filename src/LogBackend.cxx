// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>
#include <iterator> // for std::back_inserter()

#include <stdio.h>

static struct {
	LogLevel threshold = LogLevel::NOTICE;

	bool timestamp = false;
} log_settings;

void
SetLogThreshold(LogLevel threshold) noexcept
{
	log_settings.threshold = threshold;
}

LogLevel
GetLogThreshold() noexcept
{
	return log_settings.threshold;
}

bool
IsLogEnabled(LogLevel level) noexcept
{
	return level >= log_settings.threshold;
}

void
EnableLogTimestamp() noexcept
{
	log_settings.timestamp = true;
}

static void
AppendTimestamp(fmt::memory_buffer &buffer) noexcept
{
	const time_t now = time(nullptr);
	struct tm tm;
	if (localtime_r(&now, &tm) != nullptr)
		fmt::format_to(std::back_inserter(buffer), "{:%FT%T} ", tm);
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (!IsLogEnabled(level))
		return;

	/* assemble the whole line first, so it is written to stderr
	   with a single call */
	fmt::memory_buffer line;
	if (log_settings.timestamp)
		AppendTimestamp(line);

	fmt::format_to(std::back_inserter(line), "{}: {}\n",
		       domain.GetName(), StripRight(msg));

	fwrite(line.data(), 1, line.size(), stderr);
}
