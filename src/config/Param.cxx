// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Param.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <exception>

void
ConfigParam::ThrowWithNested() const
{
	if (IsFromCommandLine())
		std::throw_with_nested(std::runtime_error("Error in command line option"));

	std::throw_with_nested(FmtRuntimeError("Error on line {}", line));
}
