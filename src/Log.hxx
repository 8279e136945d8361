// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "LogLevel.hxx"

#include <fmt/core.h>
#if FMT_VERSION >= 80000 && FMT_VERSION < 90000
#include <fmt/format.h>
#endif

#include <exception>
#include <string_view>

class Domain;

/**
 * Emit one log message.  It is dropped if the level is below the
 * threshold (see LogBackend.hxx).
 */
void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept;

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

/**
 * Format a message with libfmt and log it.
 */
template<typename S, typename... Args>
void
LogFmt(LogLevel level, const Domain &domain,
       const S &format_str, Args&&... args) noexcept
{
#if FMT_VERSION >= 90000
	LogVFmt(level, domain, format_str,
		fmt::make_format_args(args...));
#else
	LogVFmt(level, domain, fmt::to_string_view(format_str),
		fmt::make_args_checked<Args...>(format_str,
						args...));
#endif
}

template<typename S, typename... Args>
void
FmtDebug(const Domain &domain, const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::DEBUG, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtInfo(const Domain &domain, const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::INFO, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtNotice(const Domain &domain, const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::NOTICE, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtWarning(const Domain &domain, const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::WARNING, domain, format_str, args...);
}

inline void
LogDebug(const Domain &domain, std::string_view msg) noexcept
{
	Log(LogLevel::DEBUG, domain, msg);
}

/**
 * Log an exception (including its nested exceptions) at
 * #LogLevel::ERROR.
 */
void
LogError(const std::exception_ptr &ep) noexcept;

/**
 * Like LogError(const std::exception_ptr &), but prefix the message
 * with a context string (e.g. the name of the file which failed).
 */
void
LogError(const std::exception_ptr &ep, std::string_view context) noexcept;
