// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Data.hxx"
#include "Parser.hxx"

const char *
ConfigData::GetString(ConfigOption option,
		      const char *default_value) const noexcept
{
	const auto *param = GetParam(option);
	return param != nullptr
		? param->value.c_str()
		: default_value;
}

bool
ConfigData::GetBool(ConfigOption option, bool default_value) const
{
	return With(option, [default_value](const char *s){
		return s != nullptr ? ParseBool(s) : default_value;
	});
}

double
ConfigData::GetDouble(ConfigOption option, double default_value) const
{
	return With(option, [default_value](const char *s){
		return s != nullptr ? ParseDouble(s) : default_value;
	});
}
