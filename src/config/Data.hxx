// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Option.hxx"
#include "Param.hxx"

#include <array>
#include <cstddef>
#include <optional>
#include <utility>

/**
 * The settings from the configuration file and the command line.
 * Each option has at most one value.
 */
struct ConfigData {
	std::array<std::optional<ConfigParam>, std::size_t(ConfigOption::MAX)> params;

	/**
	 * Assign a value, replacing the previous one.
	 *
	 * @return the previous value
	 */
	std::optional<ConfigParam> SetParam(ConfigOption option,
					    ConfigParam &&param) noexcept {
		return std::exchange(params[std::size_t(option)],
				     std::move(param));
	}

	[[gnu::pure]]
	const ConfigParam *GetParam(ConfigOption option) const noexcept {
		const auto &param = params[std::size_t(option)];
		return param ? &*param : nullptr;
	}

	/**
	 * Invoke a function with the value of the option (or nullptr
	 * if it is not set).  Errors thrown by the function are
	 * wrapped with the origin of the value.
	 */
	template<typename F>
	auto With(ConfigOption option, F &&f) const {
		const auto *param = GetParam(option);
		return param != nullptr
			? param->With(std::forward<F>(f))
			: f(nullptr);
	}

	[[gnu::pure]]
	const char *GetString(ConfigOption option,
			      const char *default_value=nullptr) const noexcept;

	/**
	 * Throws on error.
	 */
	bool GetBool(ConfigOption option, bool default_value) const;

	/**
	 * Throws on error.
	 */
	double GetDouble(ConfigOption option, double default_value) const;
};
