// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "config/File.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "config/Parser.hxx"
#include "io/MemoryReader.hxx"
#include "system/Error.hxx"
#include "util/Exception.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

static ConfigData
ParseConfig(std::string_view contents)
{
	MemoryReader reader{AsBytes(contents)};
	ConfigData config;
	ReadConfigFile(config, reader);
	return config;
}

/**
 * Parse the configuration and return the full error message.
 */
static std::string
ParseConfigError(std::string_view contents)
{
	try {
		ParseConfig(contents);
	} catch (...) {
		return GetFullMessage(std::current_exception());
	}

	ADD_FAILURE() << "Error expected";
	return {};
}

TEST(ConfigFile, Empty)
{
	const auto config = ParseConfig(""sv);
	EXPECT_EQ(config.GetParam(ConfigOption::SOUNDS_FOLDER), nullptr);
	EXPECT_STREQ(config.GetString(ConfigOption::SOUNDS_FOLDER, "sounds"),
		     "sounds");
	EXPECT_EQ(config.GetDouble(ConfigOption::VOLUME, 1.0), 1.0);
	EXPECT_FALSE(config.GetBool(ConfigOption::LOG_TIMESTAMP, false));
}

TEST(ConfigFile, Values)
{
	const auto config = ParseConfig(R"(# oggdur configuration

sounds_folder "my sounds"
  output_file mission/description.ext   # a comment
class_name "Cfg\"Sounds\""
volume 0.5
log_timestamp yes
log_level "debug"
)"sv);

	EXPECT_STREQ(config.GetString(ConfigOption::SOUNDS_FOLDER), "my sounds");
	EXPECT_STREQ(config.GetString(ConfigOption::OUTPUT_FILE),
		     "mission/description.ext");
	EXPECT_STREQ(config.GetString(ConfigOption::CLASS_NAME), "Cfg\"Sounds\"");
	EXPECT_EQ(config.GetDouble(ConfigOption::VOLUME, 1.0), 0.5);
	EXPECT_TRUE(config.GetBool(ConfigOption::LOG_TIMESTAMP, false));
	EXPECT_STREQ(config.GetString(ConfigOption::LOG_LEVEL), "debug");

	const auto *param = config.GetParam(ConfigOption::SOUNDS_FOLDER);
	ASSERT_NE(param, nullptr);
	EXPECT_EQ(param->line, 3U);
}

TEST(ConfigFile, NoTrailingNewline)
{
	const auto config = ParseConfig("volume 2"sv);
	EXPECT_EQ(config.GetDouble(ConfigOption::VOLUME, 1.0), 2.0);
}

TEST(ConfigFile, Override)
{
	const auto config = ParseConfig("class_name A\n"
					"class_name B\n"sv);

	const auto *param = config.GetParam(ConfigOption::CLASS_NAME);
	ASSERT_NE(param, nullptr);
	EXPECT_EQ(param->value, "B");
	EXPECT_EQ(param->line, 2U);
}

TEST(ConfigFile, CommandLineOverride)
{
	auto config = ParseConfig("sounds_folder a\n"sv);
	const auto old = config.SetParam(ConfigOption::SOUNDS_FOLDER,
					 ConfigParam("b"));
	ASSERT_TRUE(old);
	EXPECT_EQ(old->value, "a");
	EXPECT_EQ(old->line, 1U);

	EXPECT_STREQ(config.GetString(ConfigOption::SOUNDS_FOLDER), "b");
	EXPECT_TRUE(config.GetParam(ConfigOption::SOUNDS_FOLDER)->IsFromCommandLine());
}

TEST(ConfigFile, SyntaxErrors)
{
	EXPECT_EQ(ParseConfigError("foo bar\n"sv),
		  "Error on line 1; unrecognized parameter: foo");
	EXPECT_EQ(ParseConfigError("\n\nvolume\n"sv),
		  "Error on line 3; Value missing");
	EXPECT_EQ(ParseConfigError("class_name a b\n"sv),
		  "Error on line 1; Unknown tokens after value");
	EXPECT_EQ(ParseConfigError("class_name \"abc\n"sv),
		  "Error on line 1; Missing closing '\"'");
	EXPECT_EQ(ParseConfigError("9volume 1\n"sv),
		  "Error on line 1; Letter expected");
}

TEST(ConfigFile, ValueErrors)
{
	const auto config = ParseConfig("# x\n"
					"volume loud\n"
					"log_timestamp maybe\n"sv);

	try {
		config.GetDouble(ConfigOption::VOLUME, 1.0);
		FAIL() << "Error expected";
	} catch (const std::runtime_error &e) {
		EXPECT_EQ(GetFullMessage(e),
			  "Error on line 2; Not a valid number: \"loud\"");
	}

	try {
		config.GetBool(ConfigOption::LOG_TIMESTAMP, false);
		FAIL() << "Error expected";
	} catch (const std::runtime_error &e) {
		EXPECT_EQ(GetFullMessage(e),
			  "Error on line 3; Not a valid boolean (\"yes\" or \"no\"): \"maybe\"");
	}
}

TEST(ConfigFile, CommandLineValueError)
{
	ConfigData config;
	config.SetParam(ConfigOption::VOLUME, ConfigParam("x"));

	try {
		config.GetDouble(ConfigOption::VOLUME, 1.0);
		FAIL() << "Error expected";
	} catch (const std::runtime_error &e) {
		EXPECT_EQ(GetFullMessage(e),
			  "Error in command line option; Not a valid number: \"x\"");
	}
}

TEST(ConfigFile, MissingFile)
{
	ConfigData config;

	try {
		ReadConfigFile(config, "/nonexistent/oggdur.conf");
		FAIL() << "Error expected";
	} catch (const std::runtime_error &e) {
		const auto *se = FindNested<std::system_error>(e);
		ASSERT_NE(se, nullptr);
		EXPECT_TRUE(IsFileNotFound(*se));
	}
}

TEST(ConfigOption, Names)
{
	EXPECT_EQ(ParseConfigOptionName("volume"), ConfigOption::VOLUME);
	EXPECT_EQ(ParseConfigOptionName("log_timestamp"),
		  ConfigOption::LOG_TIMESTAMP);
	EXPECT_EQ(ParseConfigOptionName("Volume"), ConfigOption::MAX);
	EXPECT_EQ(ParseConfigOptionName(""), ConfigOption::MAX);
	EXPECT_STREQ(GetConfigOptionName(ConfigOption::SOUNDS_FOLDER),
		     "sounds_folder");
}

TEST(ConfigParser, Bool)
{
	EXPECT_TRUE(ParseBool("yes"));
	EXPECT_TRUE(ParseBool("TRUE"));
	EXPECT_TRUE(ParseBool("1"));
	EXPECT_FALSE(ParseBool("no"));
	EXPECT_FALSE(ParseBool("False"));
	EXPECT_FALSE(ParseBool("0"));
	EXPECT_THROW(ParseBool(""), std::runtime_error);
	EXPECT_THROW(ParseBool("2"), std::runtime_error);
}

TEST(ConfigParser, Double)
{
	EXPECT_EQ(ParseDouble("1"), 1.0);
	EXPECT_EQ(ParseDouble("0.75"), 0.75);
	EXPECT_EQ(ParseDouble("-2.5"), -2.5);
	EXPECT_EQ(ParseDouble("1e3"), 1000.0);
	EXPECT_THROW(ParseDouble(""), std::runtime_error);
	EXPECT_THROW(ParseDouble("1.0x"), std::runtime_error);
	EXPECT_THROW(ParseDouble(" 1"), std::runtime_error);
}
