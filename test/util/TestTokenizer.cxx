// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "util/Tokenizer.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

TEST(Tokenizer, Words)
{
	Tokenizer t{"  sounds_folder music2 \t"sv};
	EXPECT_EQ(t.NextWord(), "sounds_folder"sv);
	EXPECT_EQ(t.NextWord(), "music2"sv);
	EXPECT_TRUE(t.IsEnd());
	EXPECT_EQ(t.NextWord(), ""sv);
}

TEST(Tokenizer, InvalidWord)
{
	Tokenizer a{"1abc"sv};
	EXPECT_THROW(a.NextWord(), std::runtime_error);

	Tokenizer b{"ab-c"sv};
	EXPECT_THROW(b.NextWord(), std::runtime_error);
}

TEST(Tokenizer, Unquoted)
{
	Tokenizer t{"a/b.ext  c:\\d"sv};
	EXPECT_EQ(t.NextUnquoted(), "a/b.ext"sv);
	EXPECT_EQ(t.NextUnquoted(), "c:\\d"sv);
	EXPECT_TRUE(t.IsEnd());

	Tokenizer q{"a\"b"sv};
	EXPECT_THROW(q.NextUnquoted(), std::runtime_error);
}

TEST(Tokenizer, String)
{
	Tokenizer t{R"("my sounds" "a\"b\\c" "")"sv};
	EXPECT_EQ(t.NextString(), "my sounds");
	EXPECT_EQ(t.NextString(), "a\"b\\c");
	EXPECT_EQ(t.NextString(), "");
	EXPECT_EQ(t.NextString(), std::nullopt);
}

TEST(Tokenizer, StringErrors)
{
	Tokenizer unquoted{"abc"sv};
	EXPECT_THROW(unquoted.NextString(), std::runtime_error);

	Tokenizer unterminated{R"("abc)"sv};
	EXPECT_THROW(unterminated.NextString(), std::runtime_error);

	Tokenizer trailing_escape{R"("abc\)"sv};
	EXPECT_THROW(trailing_escape.NextString(), std::runtime_error);

	Tokenizer no_space{R"("abc"def)"sv};
	EXPECT_THROW(no_space.NextString(), std::runtime_error);
}

TEST(Tokenizer, Param)
{
	Tokenizer t{R"(plain "quoted value" # comment)"sv};
	EXPECT_EQ(t.NextParam(), "plain");
	EXPECT_EQ(t.NextParam(), "quoted value");
	EXPECT_FALSE(t.IsEnd());
	EXPECT_EQ(t.CurrentChar(), '#');
	EXPECT_EQ(t.Rest(), "# comment"sv);
}
