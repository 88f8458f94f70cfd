/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cmath>

#include "Types.hpp"

class WRateFormat
{
public:
	// Round half away from zero to a fixed number of decimals
	static double Round(double Value, int Decimals)
	{
		double const Scale = std::pow(10.0, Decimals);
		return std::round(Value * Scale) / Scale;
	}

	static WMbps BytesToMbps(WBytes Bytes, WSeconds Elapsed)
	{
		if (Elapsed <= 0)
		{
			return 0;
		}
		return static_cast<double>(Bytes) * 8.0 / WBitsPerMegabit / Elapsed;
	}
};

class WTemperatureFormat
{
public:
	// Sensors report either whole degrees or millidegrees
	static double FromRaw(long long Raw)
	{
		if (Raw < 200)
		{
			return WRateFormat::Round(static_cast<double>(Raw), 1);
		}
		return WRateFormat::Round(static_cast<double>(Raw) / 1000.0, 1);
	}
};
