/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "Data/Snapshot.hpp"
#include "Types.hpp"

struct WCounterReading
{
	WBytes RxBytes{};
	WBytes TxBytes{};
};

class WMetricsParser
{
public:
	// "load 0.42", "ping 12.3", "temp 51234", "mem 37", unknown keys are ignored
	static WSystemReadings ParseSystem(std::vector<std::string> const& Lines);

	// First line that yields two counters, either "<rx> <tx>" or a raw
	// /proc/net/dev row "eth0: rx_bytes packets ... tx_bytes ..."
	static std::optional<WCounterReading> ParseCounters(std::vector<std::string> const& Lines);
};
