// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "OptionParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <string_view>
#include <utility>

inline const char *
OptionParser::Shift() noexcept
{
	const char *value = args.front();
	args = args.subspan(1);
	return value;
}

const char *
OptionParser::ShiftValue(const char *option)
{
	if (args.empty())
		throw FmtRuntimeError("Value expected after {}", option);

	return Shift();
}

OptionParser::Result
OptionParser::ParseLongOption(const char *arg)
{
	const std::string_view s{arg + 2};
	const auto eq = s.find('=');
	const auto name = s.substr(0, eq);

	for (const auto &i : options) {
		if (!i.HasLongOption() || name != i.long_option)
			continue;

		const int index = &i - options.data();

		if (eq != s.npos) {
			if (!i.has_value)
				throw FmtRuntimeError("Option --{} does not take a value",
						      name);

			return {index, arg + 2 + eq + 1};
		}

		return {index, i.has_value ? ShiftValue(arg) : nullptr};
	}

	throw FmtRuntimeError("Unknown option: {}", arg);
}

OptionParser::Result
OptionParser::ParseShortOption()
{
	const char ch = *pending_short++;
	if (*pending_short == 0)
		pending_short = nullptr;

	for (const auto &i : options) {
		if (!i.HasShortOption() || ch != i.short_option)
			continue;

		const int index = &i - options.data();
		if (!i.has_value)
			return {index, nullptr};

		if (pending_short != nullptr)
			/* the rest of the group is the value */
			return {index, std::exchange(pending_short, nullptr)};

		const char option[] = {'-', ch, 0};
		return {index, ShiftValue(option)};
	}

	pending_short = nullptr;
	throw FmtRuntimeError("Unknown option: -{}", ch);
}

OptionParser::Result
OptionParser::Next()
{
	if (pending_short != nullptr)
		return ParseShortOption();

	while (!args.empty()) {
		const char *arg = Shift();

		if (end_of_options || arg[0] != '-' || arg[1] == 0) {
			remaining.push_back(arg);
		} else if (arg[1] != '-') {
			pending_short = arg + 1;
			return ParseShortOption();
		} else if (arg[2] == 0) {
			end_of_options = true;
		} else {
			return ParseLongOption(arg);
		}
	}

	return {-1, nullptr};
}
