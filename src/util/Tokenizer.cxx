// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Tokenizer.hxx"
#include "CharUtil.hxx"
#include "StringStrip.hxx"

#include <stdexcept>

static constexpr bool
valid_word_first_char(char ch) noexcept
{
	return IsAlphaASCII(ch);
}

static constexpr bool
valid_word_char(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '_';
}

static constexpr bool
valid_unquoted_char(char ch) noexcept
{
	return (unsigned char)ch > 0x20 && ch != '"' && ch != '\'';
}

Tokenizer::Tokenizer(std::string_view _input) noexcept
	:input(StripLeft(_input))
{
}

std::string_view
Tokenizer::Consume(std::size_t length) noexcept
{
	const auto token = input.substr(0, length);
	input = StripLeft(input.substr(length));
	return token;
}

std::string_view
Tokenizer::NextWord()
{
	if (input.empty())
		return {};

	if (!valid_word_first_char(input.front()))
		throw std::runtime_error("Letter expected");

	std::size_t length = 1;
	for (; length < input.size(); ++length) {
		const char ch = input[length];
		if (IsWhitespaceOrNull(ch))
			break;

		if (!valid_word_char(ch))
			throw std::runtime_error("Invalid word character");
	}

	return Consume(length);
}

std::string_view
Tokenizer::NextUnquoted()
{
	if (input.empty())
		return {};

	std::size_t length = 0;
	for (; length < input.size(); ++length) {
		const char ch = input[length];
		if (IsWhitespaceOrNull(ch))
			break;

		if (!valid_unquoted_char(ch))
			throw std::runtime_error("Invalid unquoted character");
	}

	return Consume(length);
}

std::optional<std::string>
Tokenizer::NextString()
{
	if (input.empty())
		/* end of line */
		return std::nullopt;

	if (input.front() != '"')
		throw std::runtime_error("'\"' expected");

	std::string value;

	std::size_t i = 1;
	while (true) {
		if (i >= input.size())
			throw std::runtime_error("Missing closing '\"'");

		char ch = input[i++];
		if (ch == '"')
			break;

		if (ch == '\\') {
			/* the backslash escapes the following
			   character */
			if (i >= input.size())
				throw std::runtime_error("Missing closing '\"'");

			ch = input[i++];
		}

		value.push_back(ch);
	}

	/* the following character must be a whitespace (or end of
	   line) */

	if (i < input.size() && !IsWhitespaceOrNull(input[i]))
		throw std::runtime_error("Space expected after closing '\"'");

	Consume(i);
	return value;
}

std::optional<std::string>
Tokenizer::NextParam()
{
	if (input.empty())
		return std::nullopt;

	if (input.front() == '"')
		return NextString();

	return std::string{NextUnquoted()};
}
