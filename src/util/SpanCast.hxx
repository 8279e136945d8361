// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

constexpr std::span<const char>
ToSpan(std::string_view sv) noexcept
{
	return {sv.data(), sv.size()};
}

inline std::span<const std::byte>
AsBytes(std::string_view sv) noexcept
{
	return std::as_bytes(ToSpan(sv));
}

inline std::string_view
ToStringView(std::span<const std::byte> s) noexcept
{
	return {reinterpret_cast<const char *>(s.data()), s.size()};
}
