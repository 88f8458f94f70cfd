/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SegmentParser.hpp"

#include <spdlog/spdlog.h>

#include "StringUtil.hpp"

char const* ESection::ToString(Type Section)
{
	switch (Section)
	{
		case Addresses:
			return "addresses";
		case Wireless:
			return "wireless";
		case Leases:
			return "leases";
		case System:
			return "system";
		case Counters:
			return "counters";
		case Default:
		case Count:
		default:
			return "default";
	}
}

WSegmentParser::WSegmentParser(std::vector<WSectionMarker> Markers_) : Markers(std::move(Markers_))
{
}

std::vector<WSectionMarker> WSegmentParser::DefaultMarkers()
{
	return {
		{ "---ARP---", ESection::Addresses },
		{ "---WIFI_SCAN---", ESection::Wireless },
		{ "---DHCP---", ESection::Leases },
		{ "---SYSTEM---", ESection::System },
		{ "---COUNTERS---", ESection::Counters },
	};
}

std::optional<ESection::Type> WSegmentParser::MatchMarker(std::string_view Line) const
{
	for (auto const& [Marker, Section] : Markers)
	{
		if (Line.find(Marker) != std::string_view::npos)
		{
			return Section;
		}
	}
	return std::nullopt;
}

WSectionMap WSegmentParser::Parse(std::string_view Text) const
{
	WSectionMap    Result{};
	ESection::Type State = ESection::Default;

	for (auto& Line : WStringUtil::SplitLines(Text))
	{
		if (WStringUtil::Trim(Line).empty())
		{
			continue;
		}

		if (auto Next = MatchMarker(Line))
		{
			if (Result.Seen[*Next])
			{
				spdlog::debug("Section '{}' appeared twice, appending", ESection::ToString(*Next));
			}
			State = *Next;
			Result.Seen[State] = true;
			continue;
		}

		Result.Lines[State].push_back(std::move(Line));
	}

	return Result;
}

std::vector<WLinePair> WSegmentParser::SplitPairs(
	std::string_view Text, std::string_view OutboundMarker, std::string_view InboundMarker)
{
	std::vector<WLinePair>     Pairs{};
	std::optional<std::string> PendingOutbound{};

	for (auto& Line : WStringUtil::SplitLines(Text))
	{
		if (Line.find(OutboundMarker) != std::string::npos)
		{
			if (PendingOutbound)
			{
				spdlog::trace("Dropping outbound line without inbound partner: '{}'", *PendingOutbound);
			}
			PendingOutbound = std::move(Line);
		}
		else if (Line.find(InboundMarker) != std::string::npos)
		{
			if (!PendingOutbound)
			{
				spdlog::trace("Dropping inbound line without outbound partner: '{}'", Line);
				continue;
			}
			Pairs.push_back({ std::move(*PendingOutbound), std::move(Line) });
			PendingOutbound.reset();
		}
	}

	if (PendingOutbound)
	{
		spdlog::trace("Dropping trailing outbound line: '{}'", *PendingOutbound);
	}
	return Pairs;
}
