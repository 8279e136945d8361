// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <exception>
#include <string>

/**
 * Obtain the full concatenated message of an exception and its nested
 * chain.
 */
[[gnu::pure]]
std::string
GetFullMessage(const std::exception &e,
	       const char *fallback="Unknown exception",
	       const char *separator="; ") noexcept;

/**
 * Extract the full message of a C++ exception.
 */
[[gnu::pure]]
std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback="Unknown exception",
	       const char *separator="; ") noexcept;

/**
 * Find an instance of #T in the nested exception chain, and return a
 * pointer to it.  Returns nullptr if no such instance was found.
 */
template<typename T>
[[gnu::pure]]
inline const T *
FindNested(const std::exception &e) noexcept
{
	if (const auto *t = dynamic_cast<const T *>(&e))
		return t;

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		return FindNested<T>(nested);
	} catch (...) {
		/* not derived from std::exception; cannot be #T */
		return nullptr;
	}

	return nullptr;
}
