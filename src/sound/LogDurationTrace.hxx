// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "lib/xiph/VorbisDurationTrace.hxx"

/**
 * A #VorbisDurationTrace which writes everything to the log at
 * #LogLevel::DEBUG.
 */
class LogDurationTrace final : public VorbisDurationTrace {
public:
	/* virtual methods from class VorbisDurationTrace */
	void OnVorbisIdentification(const VorbisIdentificationHeader &header) noexcept override;
	void OnStreamSize(uint_least64_t size) noexcept override;
	void OnLastPage(uint_least64_t offset,
			uint_least64_t granule_position) noexcept override;
	void OnDuration(double seconds) noexcept override;
};
