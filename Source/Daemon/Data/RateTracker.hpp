/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <mutex>
#include <optional>

#include "Types.hpp"
#include "Data/RateItem.hpp"

/**
 * Turns the gateway's cumulative WAN byte counters into throughput.
 * Holds the previous reading, every Update() reads it, computes the rates
 * and overwrites it under one lock so concurrent polls can not interleave
 * between the read and the write.
 */
class WRateTracker
{
	mutable std::mutex Mutex;
	WCounterSample     Previous{};
	bool               bHasPrevious{ false };
	int                Decimals;

public:
	explicit WRateTracker(int Decimals_ = 2) : Decimals(Decimals_) {}

	// First call, clock not advanced -> all zero. Counter resets are clamped to zero.
	// The stored reading is replaced on every call
	WRateItem Update(WBytes RxBytes, WBytes TxBytes, WSeconds Now);

	[[nodiscard]] std::optional<WCounterSample> GetPrevious() const;
};
