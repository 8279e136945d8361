// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstdint>

struct VorbisIdentificationHeader;

/**
 * An optional observer which gets notified about the intermediate
 * results of ComputeVorbisDuration().  It is used for diagnostics
 * only and cannot influence the result.
 */
class VorbisDurationTrace {
public:
	virtual ~VorbisDurationTrace() noexcept = default;

	virtual void OnVorbisIdentification(const VorbisIdentificationHeader &header) noexcept = 0;

	virtual void OnStreamSize(uint_least64_t size) noexcept = 0;

	/**
	 * @param offset the absolute offset of the last page
	 */
	virtual void OnLastPage(uint_least64_t offset,
				uint_least64_t granule_position) noexcept = 0;

	virtual void OnDuration(double seconds) noexcept = 0;
};
