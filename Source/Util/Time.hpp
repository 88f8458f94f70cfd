/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <chrono>
#include <ctime>
#include <string>
#include <spdlog/fmt/fmt.h>

#include "Types.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"

namespace WTime
{
	// Monotonic clock used for rate deltas, wall clock jumps must not produce spikes
	static WSeconds GetMonotonicSeconds()
	{
		return std::chrono::duration_cast<std::chrono::duration<double>>(
			std::chrono::steady_clock::now().time_since_epoch())
			.count();
	}

	// Local wall clock as HH:MM:SS
	static std::string FormatClock(std::time_t Time)
	{
		std::tm LocalTime{};
		localtime_r(&Time, &LocalTime);
		return fmt::format("{:02}:{:02}:{:02}", LocalTime.tm_hour, LocalTime.tm_min, LocalTime.tm_sec);
	}

	static std::string NowClock()
	{
		return FormatClock(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
	}
} // namespace WTime

#pragma GCC diagnostic pop
