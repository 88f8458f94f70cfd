/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SignalHandler.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

static void OnStopSignal(int)
{
	WSignalHandler::GetInstance().bStop = true;
}

WSignalHandler::WSignalHandler()
{
	signal(SIGINT, OnStopSignal);
	signal(SIGTERM, OnStopSignal);
	// ssh children closing their pipe early must not kill the daemon
	signal(SIGPIPE, SIG_IGN);
}

bool WSignalHandler::SleepFor(std::chrono::milliseconds Duration) const
{
	constexpr std::chrono::milliseconds Slice{ 50 };

	auto const Deadline = std::chrono::steady_clock::now() + Duration;
	while (!bStop)
	{
		auto const Now = std::chrono::steady_clock::now();
		if (Now >= Deadline)
		{
			return true;
		}
		auto const Remaining = std::chrono::duration_cast<std::chrono::milliseconds>(Deadline - Now);
		std::this_thread::sleep_for(std::min(Remaining, Slice));
	}
	return false;
}
