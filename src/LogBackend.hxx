// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "LogLevel.hxx"

/**
 * Messages below this level are discarded.  The default is
 * #LogLevel::NOTICE.
 */
void
SetLogThreshold(LogLevel threshold) noexcept;

[[gnu::pure]]
LogLevel
GetLogThreshold() noexcept;

/**
 * Would a message with this level be printed?  Callers use this
 * to skip expensive diagnostics.
 */
[[gnu::pure]]
bool
IsLogEnabled(LogLevel level) noexcept;

/**
 * Prefix each message with the local time.
 */
void
EnableLogTimestamp() noexcept;
