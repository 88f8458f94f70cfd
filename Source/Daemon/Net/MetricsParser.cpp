/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "MetricsParser.hpp"

#include <spdlog/spdlog.h>

#include "Format.hpp"
#include "StringUtil.hpp"

WSystemReadings WMetricsParser::ParseSystem(std::vector<std::string> const& Lines)
{
	WSystemReadings Readings{};

	for (auto const& Line : Lines)
	{
		auto const Parts = WStringUtil::SplitWhitespace(Line);
		if (Parts.size() < 2)
		{
			spdlog::trace("Skipping system line '{}'", Line);
			continue;
		}

		auto const& Key = Parts[0];
		auto const& Value = Parts[1];
		if (Key == "load")
		{
			Readings.Load = Value;
		}
		else if (Key == "ping")
		{
			Readings.Ping = Value;
		}
		else if (Key == "temp")
		{
			if (auto Raw = WStringUtil::ParseUnsigned<unsigned long long>(Value))
			{
				Readings.Temperature = WTemperatureFormat::FromRaw(static_cast<long long>(*Raw));
			}
		}
		else if (Key == "mem")
		{
			if (WStringUtil::IsDigits(Value))
			{
				Readings.MemoryPercent = Value;
			}
		}
	}

	return Readings;
}

std::optional<WCounterReading> WMetricsParser::ParseCounters(std::vector<std::string> const& Lines)
{
	for (auto const& Line : Lines)
	{
		// /proc/net/dev glues the interface name to the first counter once it gets large
		auto const                     Colon = Line.find(':');
		std::vector<std::string> const Parts =
			WStringUtil::SplitWhitespace(Colon == std::string::npos ? Line : Line.substr(Colon + 1));

		size_t const TxIndex = Colon == std::string::npos ? 1 : 8;
		if (Parts.size() <= TxIndex)
		{
			spdlog::trace("Skipping counter line '{}'", Line);
			continue;
		}

		auto Rx = WStringUtil::ParseUnsigned<WBytes>(Parts[0]);
		auto Tx = WStringUtil::ParseUnsigned<WBytes>(Parts[TxIndex]);
		if (!Rx || !Tx)
		{
			spdlog::trace("Skipping counter line '{}'", Line);
			continue;
		}
		return WCounterReading{ *Rx, *Tx };
	}
	return std::nullopt;
}
