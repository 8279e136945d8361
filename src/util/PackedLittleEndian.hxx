// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstdint>

/**
 * A packed little-endian 32 bit integer.  It has no alignment
 * requirement, which allows overlaying it on arbitrary byte buffers
 * (e.g. file headers).
 */
class PackedLE32 {
	uint8_t b[4];

public:
	PackedLE32() = default;

	constexpr PackedLE32(uint32_t src) noexcept
		:b{uint8_t(src), uint8_t(src >> 8),
		   uint8_t(src >> 16), uint8_t(src >> 24)} {}

	constexpr operator uint32_t() const noexcept {
		return uint32_t(b[0]) | (uint32_t(b[1]) << 8) |
			(uint32_t(b[2]) << 16) | (uint32_t(b[3]) << 24);
	}
};

static_assert(sizeof(PackedLE32) == sizeof(uint32_t), "Wrong size");
static_assert(alignof(PackedLE32) == 1, "Wrong alignment");

/**
 * A packed little-endian 64 bit integer.
 */
class PackedLE64 {
	PackedLE32 lo, hi;

public:
	PackedLE64() = default;

	constexpr PackedLE64(uint64_t src) noexcept
		:lo(uint32_t(src)), hi(uint32_t(src >> 32)) {}

	constexpr operator uint64_t() const noexcept {
		return uint64_t(uint32_t(lo)) | (uint64_t(uint32_t(hi)) << 32);
	}
};

static_assert(sizeof(PackedLE64) == sizeof(uint64_t), "Wrong size");
static_assert(alignof(PackedLE64) == 1, "Wrong alignment");
