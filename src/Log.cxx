// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Log.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <iterator> // for std::back_inserter()

static constexpr Domain exception_domain("exception");

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	Log(level, domain, {buffer.data(), buffer.size()});
}

void
LogError(const std::exception_ptr &ep) noexcept
{
	Log(LogLevel::ERROR, exception_domain, GetFullMessage(ep));
}

void
LogError(const std::exception_ptr &ep, std::string_view context) noexcept
{
	LogFmt(LogLevel::ERROR, exception_domain, "{}: {}",
	       context, GetFullMessage(ep));
}
