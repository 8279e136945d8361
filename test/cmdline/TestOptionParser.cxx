// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "cmdline/OptionParser.hxx"
#include "cmdline/OptionDef.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

enum Option {
	OPTION_CONFIG,
	OPTION_VERBOSE,
	OPTION_VERSION,
	OPTION_QUIET,
	OPTION_HELP2,
};

static constexpr OptionDef option_defs[] = {
	{"config", 'c', true, "configuration file"},
	{"verbose", 'v', "verbose logging"},
	{"version", 'V', "print version number"},
	{"quiet", 'q', "quiet"},
	{nullptr, '?', nullptr},
};

/**
 * A mutable argv array.
 */
class ArgumentVector {
	std::vector<std::string> storage;
	std::vector<char *> argv;

public:
	ArgumentVector(std::initializer_list<const char *> args)
		:storage(args.begin(), args.end()) {
		for (auto &i : storage)
			argv.push_back(i.data());
		argv.push_back(nullptr);
	}

	int GetArgc() const noexcept {
		return int(storage.size());
	}

	char **GetArgv() noexcept {
		return argv.data();
	}
};

static std::string
NextError(OptionParser &parser)
{
	try {
		parser.Next();
	} catch (const std::exception &e) {
		return GetFullMessage(e);
	}

	ADD_FAILURE() << "Error expected";
	return {};
}

TEST(OptionParser, Options)
{
	ArgumentVector args{"oggdur", "-v", "a.ogg", "--config", "x.conf",
		"-", "--config=y.conf", "-c", "z.conf", "-?", "b.ogg"};
	OptionParser parser(option_defs, args.GetArgc(), args.GetArgv());

	auto o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, OPTION_VERBOSE);
	EXPECT_EQ(o.value, nullptr);

	o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, OPTION_CONFIG);
	EXPECT_STREQ(o.value, "x.conf");

	o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, OPTION_CONFIG);
	EXPECT_STREQ(o.value, "y.conf");

	o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, OPTION_CONFIG);
	EXPECT_STREQ(o.value, "z.conf");

	o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, OPTION_HELP2);

	EXPECT_FALSE(parser.Next());

	const auto remaining = parser.GetRemaining();
	ASSERT_EQ(remaining.size(), 3U);
	EXPECT_STREQ(remaining[0], "a.ogg");
	EXPECT_STREQ(remaining[1], "-");
	EXPECT_STREQ(remaining[2], "b.ogg");
}

TEST(OptionParser, LongOptionPrefix)
{
	/* "--version" must not be mistaken for "--verbose" and vice
	   versa */
	ArgumentVector args{"oggdur", "--version", "--verbose"};
	OptionParser parser(option_defs, args.GetArgc(), args.GetArgv());

	EXPECT_EQ(parser.Next().index, OPTION_VERSION);
	EXPECT_EQ(parser.Next().index, OPTION_VERBOSE);
	EXPECT_FALSE(parser.Next());
}

TEST(OptionParser, Errors)
{
	ArgumentVector args{"oggdur", "--bogus", "--verb", "--verbose=yes",
		"-x", "-vxq", "--config"};
	OptionParser parser(option_defs, args.GetArgc(), args.GetArgv());

	EXPECT_EQ(NextError(parser), "Unknown option: --bogus");
	EXPECT_EQ(NextError(parser), "Unknown option: --verb");
	EXPECT_EQ(NextError(parser), "Option --verbose does not take a value");
	EXPECT_EQ(NextError(parser), "Unknown option: -x");

	/* the rest of a group is dropped after an error */
	EXPECT_EQ(parser.Next().index, OPTION_VERBOSE);
	EXPECT_EQ(NextError(parser), "Unknown option: -x");

	EXPECT_EQ(NextError(parser), "Value expected after --config");
	EXPECT_FALSE(parser.Next());
}

TEST(OptionParser, Empty)
{
	ArgumentVector args{"oggdur"};
	OptionParser parser(option_defs, args.GetArgc(), args.GetArgv());

	EXPECT_FALSE(parser.Next());
	EXPECT_TRUE(parser.GetRemaining().empty());
}

TEST(OptionParser, ShortOptionGroup)
{
	ArgumentVector args{"oggdur", "-vq", "-vcx.conf", "-qc", "y.conf",
		"-cv"};
	OptionParser parser(option_defs, args.GetArgc(), args.GetArgv());

	EXPECT_EQ(parser.Next().index, OPTION_VERBOSE);
	EXPECT_EQ(parser.Next().index, OPTION_QUIET);

	EXPECT_EQ(parser.Next().index, OPTION_VERBOSE);
	auto o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, OPTION_CONFIG);
	EXPECT_STREQ(o.value, "x.conf");

	EXPECT_EQ(parser.Next().index, OPTION_QUIET);
	o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, OPTION_CONFIG);
	EXPECT_STREQ(o.value, "y.conf");

	/* "v" is the value here, not an option */
	o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, OPTION_CONFIG);
	EXPECT_STREQ(o.value, "v");

	EXPECT_FALSE(parser.Next());
	EXPECT_TRUE(parser.GetRemaining().empty());
}

TEST(OptionParser, EndOfOptions)
{
	ArgumentVector args{"oggdur", "a.ogg", "-v", "--", "-c", "--verbose",
		"--", "b.ogg"};
	OptionParser parser(option_defs, args.GetArgc(), args.GetArgv());

	EXPECT_EQ(parser.Next().index, OPTION_VERBOSE);
	EXPECT_FALSE(parser.Next());

	const auto remaining = parser.GetRemaining();
	ASSERT_EQ(remaining.size(), 5U);
	EXPECT_STREQ(remaining[0], "a.ogg");
	EXPECT_STREQ(remaining[1], "-c");
	EXPECT_STREQ(remaining[2], "--verbose");
	EXPECT_STREQ(remaining[3], "--");
	EXPECT_STREQ(remaining[4], "b.ogg");
}

TEST(OptionParser, ShortOptionMissingValue)
{
	ArgumentVector args{"oggdur", "-vc"};
	OptionParser parser(option_defs, args.GetArgc(), args.GetArgv());

	EXPECT_EQ(parser.Next().index, OPTION_VERBOSE);
	EXPECT_EQ(NextError(parser), "Value expected after -c");
	EXPECT_FALSE(parser.Next());
}
