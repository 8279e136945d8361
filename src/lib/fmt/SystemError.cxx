// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SystemError.hxx"

#include <fmt/format.h>

std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept
{
	const auto msg = fmt::vformat(format_str, args);
	return MakeErrno(code, msg.c_str());
}
