// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <charconv>
#include <cstring>

#include <strings.h> // for strcasecmp()

static bool
StringArrayContainsCase(const char *const*haystack,
			const char *needle) noexcept
{
	for (; *haystack != nullptr; ++haystack)
		if (strcasecmp(*haystack, needle) == 0)
			return true;

	return false;
}

bool
ParseBool(const char *value)
{
	static const char *const t[] = { "yes", "true", "1", nullptr };
	static const char *const f[] = { "no", "false", "0", nullptr };

	if (StringArrayContainsCase(t, value))
		return true;

	if (StringArrayContainsCase(f, value))
		return false;

	throw FmtRuntimeError(R"(Not a valid boolean ("yes" or "no"): "{}")", value);
}

double
ParseDouble(const char *s)
{
	const char *const end = s + std::strlen(s);

	double value;
	const auto [ptr, ec] = std::from_chars(s, end, value);
	if (ec != std::errc{} || ptr == s || ptr != end)
		throw FmtRuntimeError("Not a valid number: \"{}\"", s);

	return value;
}
