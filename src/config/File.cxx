// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "File.hxx"
#include "Data.hxx"
#include "Param.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"
#include "util/Tokenizer.hxx"
#include "io/FileReader.hxx"
#include "Log.hxx"

#include <array>
#include <string>

static constexpr char CONF_COMMENT = '#';

static constexpr Domain config_file_domain("config_file");

/**
 * Read the whole stream into a string.  Configuration files are
 * small.
 */
static std::string
ReadContents(Reader &reader)
{
	std::string result;
	std::array<std::byte, 4096> buffer;

	std::size_t nbytes;
	while ((nbytes = reader.Read(buffer)) > 0)
		result.append(reinterpret_cast<const char *>(buffer.data()),
			      nbytes);

	return result;
}

/**
 * Split off the first line.  The line feed is consumed but not
 * returned.
 */
static std::string_view
NextLine(std::string_view &rest) noexcept
{
	const auto newline = rest.find('\n');
	const auto line = rest.substr(0, newline);
	rest = newline == rest.npos
		? std::string_view{}
		: rest.substr(newline + 1);
	return line;
}

/**
 * Parse one "name value" line which is neither empty nor a comment.
 *
 * Throws on error.
 */
static void
ParseLine(ConfigData &config_data, unsigned line_number, std::string_view line)
{
	Tokenizer tokenizer(line);

	const auto name = tokenizer.NextWord();
	const ConfigOption option = ParseConfigOptionName(name);
	if (option == ConfigOption::MAX)
		throw FmtRuntimeError("unrecognized parameter: {}", name);

	auto value = tokenizer.NextParam();
	if (!value)
		throw std::runtime_error("Value missing");

	if (!tokenizer.IsEnd() && tokenizer.CurrentChar() != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after value");

	const auto old = config_data.SetParam(option,
					      ConfigParam(std::move(*value),
							  line_number));
	if (old)
		FmtDebug(config_file_domain,
			 "config parameter \"{}\" on line {} overrides line {}",
			 name, line_number, old->line);
}

void
ReadConfigFile(ConfigData &config_data, Reader &reader)
{
	const std::string contents = ReadContents(reader);

	std::string_view rest = contents;
	for (unsigned line_number = 1; !rest.empty(); ++line_number) {
		const auto line = StripLeft(NextLine(rest));
		if (line.empty() || line.front() == CONF_COMMENT)
			continue;

		try {
			ParseLine(config_data, line_number, line);
		} catch (...) {
			std::throw_with_nested(FmtRuntimeError("Error on line {}",
							       line_number));
		}
	}
}

void
ReadConfigFile(ConfigData &config_data, const char *path)
{
	FmtDebug(config_file_domain, "loading file {}", path);

	try {
		FileReader file(path);
		ReadConfigFile(config_data, file);
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in {}", path));
	}
}
