// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "OutputStream.hxx"

#include <string>
#include <string_view>

/**
 * An #OutputStream which collects everything in memory.
 */
class StringOutputStream final : public OutputStream {
	std::string buffer;

public:
	std::string_view GetValue() const noexcept {
		return buffer;
	}

	/* virtual methods from class OutputStream */
	void Write(std::span<const std::byte> src) override {
		buffer.append(reinterpret_cast<const char *>(src.data()),
			      src.size());
	}
};
