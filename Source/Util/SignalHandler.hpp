/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <atomic>
#include <chrono>

#include "Singleton.hpp"

class WSignalHandler : public TSingleton<WSignalHandler>
{
public:
	WSignalHandler();

	std::atomic<bool> bStop{ false };

	// Sleeps in short slices so SIGINT/SIGTERM end the wait early.
	// Returns false if a stop was requested
	bool SleepFor(std::chrono::milliseconds Duration) const;
};
