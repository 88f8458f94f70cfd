/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string_view>
#include <vector>

#include "SegmentParser.hpp"
#include "TrafficClassifier.hpp"
#include "Data/FlowItem.hpp"

// Best effort guess when neither "addr:port" nor "addr port" yields a port
constexpr WPort DefaultFlowPort = 443;

/**
 * Turns the text output of the live connection sampler (iftop -t) into flows.
 * Each flow is two lines:
 *
 *   1 192.168.1.20:51234  =>  142.250.10.5:443   1.20Kb  1.10Kb  900b  3.1KB
 *                         <=                     4.56Kb  4.00Kb  3.9Kb 11.4KB
 *
 * The destination follows the outbound marker either as "addr:port" or as two
 * fields "addr port". iftop's own text layout puts only rates after the marker
 * and the remote endpoint in front of the inbound marker, both layouts are read.
 * The bandwidth figure is the last field of the inbound line.
 */
class WFlowPairParser
{
	WTrafficClassifier const& Classifier;
	WPort                     FallbackPort;

	[[nodiscard]] std::optional<WFlowItem> ParsePair(WLinePair const& Pair) const;

public:
	explicit WFlowPairParser(WTrafficClassifier const& Classifier_, WPort FallbackPort_ = DefaultFlowPort)
		: Classifier(Classifier_), FallbackPort(FallbackPort_)
	{
	}

	// MaxFlows == 0 means unlimited
	[[nodiscard]] std::vector<WFlowItem> Parse(std::string_view SamplerOutput, size_t MaxFlows = 0) const;

	[[nodiscard]] std::vector<WFlowItem> Parse(std::vector<WLinePair> const& Pairs, size_t MaxFlows = 0) const;
};
