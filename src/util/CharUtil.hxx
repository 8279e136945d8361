// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

/**
 * Is this a control character, a space or the null byte?  Bytes
 * above 0x7f are never whitespace.
 */
constexpr bool
IsWhitespaceOrNull(char ch) noexcept
{
	return (unsigned char)ch <= 0x20;
}

constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

/**
 * Locale-independent check for an ASCII letter.
 */
constexpr bool
IsAlphaASCII(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

constexpr bool
IsAlphaNumericASCII(char ch) noexcept
{
	return IsAlphaASCII(ch) || IsDigitASCII(ch);
}
