// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

/**
 * Throws on error.
 */
bool
ParseBool(const char *value);

/**
 * Parse a floating point number.  The whole string must be a valid
 * number.
 *
 * Throws on error.
 */
double
ParseDouble(const char *s);
