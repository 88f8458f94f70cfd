/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ESection
{
	// Parser states, one per section the gateway output can contain
	enum Type : uint8_t
	{
		Default,   // lines before the first marker
		Addresses, // neighbour / ARP table
		Wireless,  // per interface station dump
		Leases,    // DHCP lease file
		System,    // pass-through readings
		Counters,  // WAN byte counters
		Count
	};

	char const* ToString(Type Section);
} // namespace ESection

struct WSectionMarker
{
	std::string    Marker{};
	ESection::Type Section{ ESection::Default };
};

// Result of splitting one blob, lines keep their original order per section
class WSectionMap
{
	std::array<std::vector<std::string>, ESection::Count> Lines{};
	std::array<bool, ESection::Count>                     Seen{};

	friend class WSegmentParser;

public:
	[[nodiscard]] std::vector<std::string> const& Get(ESection::Type Section) const { return Lines[Section]; }

	// False means the marker never appeared (SectionMissing), as opposed to an empty section
	[[nodiscard]] bool HasSection(ESection::Type Section) const { return Section == ESection::Default || Seen[Section]; }

	// Appends one section of another map, lines of its other sections are left out
	void Merge(WSectionMap const& Other, ESection::Type Section)
	{
		if (!Other.HasSection(Section))
		{
			return;
		}
		Seen[Section] = true;
		auto const& Source = Other.Lines[Section];
		Lines[Section].insert(Lines[Section].end(), Source.begin(), Source.end());
	}
};

// A raw outbound/inbound line pair from the live connection sampler
struct WLinePair
{
	std::string Outbound{};
	std::string Inbound{};
};

/**
 * The gateway commands print sentinel lines (e.g. "---DHCP---") between the
 * outputs of the individual tools. Parsing is a small state machine: the current
 * state is the section of the last marker seen, every marker line is a transition,
 * every other line is appended to the current section as is. A marker that shows
 * up twice re-enters its section, nothing is reset.
 */
class WSegmentParser
{
	std::vector<WSectionMarker> Markers;

	[[nodiscard]] std::optional<ESection::Type> MatchMarker(std::string_view Line) const;

public:
	explicit WSegmentParser(std::vector<WSectionMarker> Markers_);

	// The markers the gateway commands emit
	static std::vector<WSectionMarker> DefaultMarkers();

	[[nodiscard]] WSectionMap Parse(std::string_view Text) const;

	// Groups sampler output into (outbound, inbound) pairs. Lines containing neither
	// marker are skipped, an outbound line that is not directly followed by an inbound
	// line is dropped and so is an inbound line without an outbound line before it
	static std::vector<WLinePair> SplitPairs(
		std::string_view Text, std::string_view OutboundMarker = "=>", std::string_view InboundMarker = "<=");
};
