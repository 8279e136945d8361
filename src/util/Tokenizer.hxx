// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * Splits a line into words and (optionally quoted) strings.
 * Leading whitespace before each token is skipped.
 */
class Tokenizer {
	std::string_view input;

public:
	explicit Tokenizer(std::string_view _input) noexcept;

	Tokenizer(const Tokenizer &) = delete;
	Tokenizer &operator=(const Tokenizer &) = delete;

	bool IsEnd() const noexcept {
		return input.empty();
	}

	/**
	 * Returns the character which will be parsed next.  Must not
	 * be called at the end of the input.
	 */
	char CurrentChar() const noexcept {
		return input.front();
	}

	std::string_view Rest() const noexcept {
		return input;
	}

	/**
	 * Reads the next word: a letter followed by letters, digits
	 * and underscores.
	 *
	 * Throws std::runtime_error on error.
	 *
	 * @return the word or an empty string at the end of the line
	 */
	std::string_view NextWord();

	/**
	 * Reads the next word which may contain any printable
	 * character except for quotes.
	 *
	 * Throws std::runtime_error on error.
	 */
	std::string_view NextUnquoted();

	/**
	 * Reads the next quoted string.  A backslash escapes the
	 * following character.
	 *
	 * Throws std::runtime_error on error.
	 *
	 * @return the unquoted, unescaped string or std::nullopt at
	 * the end of the line
	 */
	std::optional<std::string> NextString();

	/**
	 * Reads a quoted string or an unquoted word.
	 */
	std::optional<std::string> NextParam();

private:
	std::string_view Consume(std::size_t length) noexcept;
};
