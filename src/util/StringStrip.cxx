// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <algorithm>

std::string_view
StripLeft(std::string_view s) noexcept
{
	auto i = std::find_if_not(s.begin(), s.end(),
				  [](char ch){ return IsWhitespaceOrNull(ch); });

	return s.substr(std::distance(s.begin(), i));
}

std::string_view
StripRight(std::string_view s) noexcept
{
	auto i = std::find_if_not(s.rbegin(), s.rend(),
				  [](char ch){ return IsWhitespaceOrNull(ch); });

	return s.substr(0, std::distance(i, s.rend()));
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
