/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "FlowPairParser.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "IPAddress.hpp"
#include "StringUtil.hpp"

namespace
{
	constexpr std::string_view OutboundMarker = "=>";
	constexpr std::string_view InboundMarker = "<=";

	std::optional<size_t> FindToken(std::vector<std::string> const& Tokens, std::string_view Token)
	{
		auto It = std::ranges::find(Tokens, Token);
		if (It == Tokens.end())
		{
			return std::nullopt;
		}
		return static_cast<size_t>(It - Tokens.begin());
	}

	bool IsAddress(std::string const& Address)
	{
		return WIPAddress::LooksLikeIPv4(Address) || WIPAddress::LooksLikeIPv6(Address);
	}
} // namespace

std::optional<WFlowItem> WFlowPairParser::ParsePair(WLinePair const& Pair) const
{
	auto const Out = WStringUtil::SplitWhitespace(Pair.Outbound);
	auto const In = WStringUtil::SplitWhitespace(Pair.Inbound);

	auto const OutMarker = FindToken(Out, OutboundMarker);
	auto const InMarker = FindToken(In, InboundMarker);
	if (!OutMarker || !InMarker || *OutMarker == 0)
	{
		return std::nullopt;
	}

	// Nothing after the inbound marker means no bandwidth figure
	if (*InMarker + 1 >= In.size())
	{
		return std::nullopt;
	}

	WFlowItem Flow{};
	// The source is right before the marker, iftop prefixes a row number
	Flow.Source = WEndpoint::FromToken(Out[*OutMarker - 1]);
	if (Flow.Source.Address.empty())
	{
		return std::nullopt;
	}

	size_t const DestIndex = *OutMarker + 1;
	if (DestIndex < Out.size() && IsAddress(WEndpoint::FromToken(Out[DestIndex]).Address))
	{
		Flow.Destination = WEndpoint::FromToken(Out[DestIndex]);
		if (!Flow.Destination.Port && DestIndex + 1 < Out.size())
		{
			// "addr port" form
			Flow.Destination.Port = WStringUtil::ParseUnsigned<WPort>(Out[DestIndex + 1]);
		}
	}
	else if (*InMarker > 0)
	{
		Flow.Destination = WEndpoint::FromToken(In[*InMarker - 1]);
	}
	else
	{
		return std::nullopt;
	}

	if (Flow.Destination.Address.empty())
	{
		return std::nullopt;
	}
	if (!Flow.Destination.Port)
	{
		Flow.Destination.Port = FallbackPort;
	}

	Flow.Bandwidth = In.back();
	Flow.Classification = Classifier.Classify(Flow.Destination.Address, *Flow.Destination.Port);
	return Flow;
}

std::vector<WFlowItem> WFlowPairParser::Parse(std::vector<WLinePair> const& Pairs, size_t MaxFlows) const
{
	std::vector<WFlowItem> Flows{};
	size_t                 Skipped = 0;

	for (auto const& Pair : Pairs)
	{
		if (MaxFlows != 0 && Flows.size() >= MaxFlows)
		{
			break;
		}

		if (auto Flow = ParsePair(Pair))
		{
			Flows.push_back(std::move(*Flow));
		}
		else
		{
			++Skipped;
			spdlog::trace("Skipping malformed flow pair '{}' / '{}'", Pair.Outbound, Pair.Inbound);
		}
	}

	if (Skipped > 0)
	{
		spdlog::debug("Skipped {} malformed flow pairs", Skipped);
	}
	return Flows;
}

std::vector<WFlowItem> WFlowPairParser::Parse(std::string_view SamplerOutput, size_t MaxFlows) const
{
	return Parse(WSegmentParser::SplitPairs(SamplerOutput, OutboundMarker, InboundMarker), MaxFlows);
}
