/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>

#include "IPAddress.hpp"

struct WClassification
{
	std::string Label{};
	std::string Tag{};
};

inline bool operator==(WClassification const& Lhs, WClassification const& Rhs)
{
	return Lhs.Label == Rhs.Label && Lhs.Tag == Rhs.Tag;
}

// One live connection as sampled during the current poll
struct WFlowItem
{
	WEndpoint       Source{};
	WEndpoint       Destination{}; // port always set
	// Trailing token of the inbound line, verbatim. With iftop -t that is the cumulative
	// column (e.g. "48.2KB"), not a rate. Still written as "last_2s", the dashboard reads that key
	std::string     Bandwidth{};
	WClassification Classification{};

	template <class Archive>
	void save(Archive& archive) const
	{
		archive(cereal::make_nvp("src", Source.ToString()), cereal::make_nvp("dst", Destination.Address),
			cereal::make_nvp("dport", Destination.Port.value_or(0)), cereal::make_nvp("last_2s", Bandwidth),
			cereal::make_nvp("label", Classification.Label), cereal::make_nvp("tag", Classification.Tag));
	}
};
