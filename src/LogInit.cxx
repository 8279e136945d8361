// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogInit.hxx"
#include "LogBackend.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "lib/fmt/RuntimeError.hxx"

LogLevel
ParseLogLevel(std::string_view value)
{
	if (value == "notice" ||
	    /* alias for compatibility */
	    value == "default")
		return LogLevel::NOTICE;
	else if (value == "info")
		return LogLevel::INFO;
	else if (value == "debug" || value == "verbose")
		return LogLevel::DEBUG;
	else if (value == "warning")
		return LogLevel::WARNING;
	else if (value == "error")
		return LogLevel::ERROR;
	else
		throw FmtRuntimeError("unknown log level \"{}\"", value);
}

void
LogEarlyInit(bool verbose) noexcept
{
	SetLogThreshold(verbose ? LogLevel::DEBUG : LogLevel::NOTICE);
}

void
LogInit(const ConfigData &config, bool verbose, bool quiet)
{
	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
	else if (quiet)
		SetLogThreshold(LogLevel::WARNING);
	else
		SetLogThreshold(config.With(ConfigOption::LOG_LEVEL, [](const char *s){
			return s != nullptr
				? ParseLogLevel(s)
				: LogLevel::NOTICE;
		}));

	if (config.GetBool(ConfigOption::LOG_TIMESTAMP, false))
		EnableLogTimestamp();
}
