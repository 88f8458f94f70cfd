/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <chrono>

#define WKiB *1024
#define WMiB *1024 WKiB

using WSeconds = double; // monotonic, fractional
using WBytes = uint64_t;
using WMbps = double;
using WFrequencyMHz = uint32_t;
using WPort = uint16_t;
using WTimeout = std::chrono::milliseconds;

// Bits per megabit as displayed by the dashboard (binary prefix)
constexpr double WBitsPerMegabit = 1 WMiB;
