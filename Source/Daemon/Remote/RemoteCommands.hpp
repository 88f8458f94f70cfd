/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "DaemonConfig.hpp"

namespace ERemoteCall
{
	// One entry per independent collaborator call of a poll
	enum Type : uint8_t
	{
		Metrics,   // system readings and WAN counters, the poll fails without it
		Flows,     // live connection sampler
		Addresses, // neighbour table
		Wireless,  // station dump per radio
		Leases,    // DHCP lease file
		Count
	};

	char const* ToString(Type Call);
} // namespace ERemoteCall

/**
 * Shell snippets run on the gateway (busybox sh compatible). Every snippet
 * that feeds the segment parser prints its own section marker first, so the
 * outputs of whichever calls succeeded can be concatenated and parsed in one go.
 * Values from the configuration are single quoted before they are embedded.
 */
class WRemoteCommands
{
	std::string WanInterface;
	std::string LanInterface;
	std::string PingHost;
	std::string LeaseFile;
	size_t      MaxFlows;

public:
	explicit WRemoteCommands(WDaemonConfig const& Config);

	[[nodiscard]] std::string Get(ERemoteCall::Type Call) const;

	[[nodiscard]] std::string SystemCommand() const;
	[[nodiscard]] std::string FlowCommand() const;
	[[nodiscard]] std::string AddressTableCommand() const;
	[[nodiscard]] std::string WirelessCommand() const;
	[[nodiscard]] std::string LeaseCommand() const;

	// foo'bar -> 'foo'\''bar'
	static std::string ShellQuote(std::string const& Value);
};
