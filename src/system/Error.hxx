// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <system_error> // IWYU pragma: export

#include <cerrno> // IWYU pragma: export

/**
 * Construct a std::system_error from an errno value.
 */
inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return {std::error_code(code, std::system_category()), msg};
}

/**
 * Construct a std::system_error from the current errno value.
 */
inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

[[gnu::pure]]
inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code() == std::error_code(code, std::system_category());
}

[[gnu::pure]]
inline bool
IsFileNotFound(const std::system_error &e) noexcept
{
	return IsErrno(e, ENOENT);
}
