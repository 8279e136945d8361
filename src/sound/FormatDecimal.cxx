// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FormatDecimal.hxx"

#include <fmt/format.h>

std::string
FormatDecimal(double value)
{
	std::string result = fmt::format("{}", value);

	if (result.find_first_of(".eEn") == result.npos)
		/* no fraction, no exponent and not "inf"/"nan" */
		result += ".0";

	return result;
}
