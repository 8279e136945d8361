// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <string>

/**
 * Format a floating point number with the shortest representation
 * which parses back to the same value.  Integral values keep a
 * trailing ".0" so the result is always recognizable as a floating
 * point literal (e.g. "50.0", "3.2653061224489797", "1e+16").
 */
std::string
FormatDecimal(double value);
