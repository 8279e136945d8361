// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Option.hxx"

#include <array>

static constexpr std::array config_option_names{
	"sounds_folder",
	"output_file",
	"class_name",
	"volume",
	"log_level",
	"log_timestamp",
};

static_assert(config_option_names.size() == std::size_t(ConfigOption::MAX),
	      "Wrong number of config_option_names");

ConfigOption
ParseConfigOptionName(std::string_view name) noexcept
{
	for (std::size_t i = 0; i < config_option_names.size(); ++i)
		if (name == config_option_names[i])
			return ConfigOption(i);

	return ConfigOption::MAX;
}

const char *
GetConfigOptionName(ConfigOption option) noexcept
{
	return config_option_names[std::size_t(option)];
}
