// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>

/**
 * A sink for bytes.  Unlike write(), Write() never returns a short
 * count: it either consumes the whole buffer or throws.
 */
class OutputStream {
public:
	virtual ~OutputStream() noexcept = default;

	virtual void Write(std::span<const std::byte> src) = 0;
};
