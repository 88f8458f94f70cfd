/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RemoteCommands.hpp"

#include <spdlog/fmt/fmt.h>

char const* ERemoteCall::ToString(Type Call)
{
	switch (Call)
	{
		case Metrics:
			return "metrics";
		case Flows:
			return "flows";
		case Addresses:
			return "addresses";
		case Wireless:
			return "wireless";
		case Leases:
			return "leases";
		default:
			return "unknown";
	}
}

WRemoteCommands::WRemoteCommands(WDaemonConfig const& Config)
	: WanInterface(Config.WanInterface)
	, LanInterface(Config.LanInterface)
	, PingHost(Config.PingHost)
	, LeaseFile(Config.LeaseFile)
	, MaxFlows(Config.MaxFlows)
{
}

std::string WRemoteCommands::ShellQuote(std::string const& Value)
{
	std::string Quoted{ "'" };
	for (char C : Value)
	{
		if (C == '\'')
		{
			Quoted += "'\\''";
		}
		else
		{
			Quoted += C;
		}
	}
	Quoted += '\'';
	return Quoted;
}

std::string WRemoteCommands::Get(ERemoteCall::Type Call) const
{
	switch (Call)
	{
		case ERemoteCall::Metrics:
			return SystemCommand();
		case ERemoteCall::Flows:
			return FlowCommand();
		case ERemoteCall::Addresses:
			return AddressTableCommand();
		case ERemoteCall::Wireless:
			return WirelessCommand();
		case ERemoteCall::Leases:
			return LeaseCommand();
		default:
			return {};
	}
}

std::string WRemoteCommands::SystemCommand() const
{
	// Thermal zones move around between targets, the first readable one wins.
	// No sensor at all leaves "temp" without a value.
	// The counters have to stay last, the poller stamps the reading when the call returns
	return fmt::format("echo '---SYSTEM---'; "
					   "echo \"load $(cut -d' ' -f1 /proc/loadavg)\"; "
					   "p=$(ping -c 1 -W 2 {} 2>/dev/null | grep -o 'time=[0-9.]*' | cut -d= -f2 | head -n1); "
					   "echo \"ping ${{p:-0}}\"; "
					   "t=$(cat /sys/class/thermal/thermal_zone0/temp 2>/dev/null || "
					   "cat /sys/devices/virtual/thermal/thermal_zone0/temp 2>/dev/null || "
					   "cat /sys/class/hwmon/hwmon0/temp1_input 2>/dev/null); "
					   "echo \"temp $t\"; "
					   "awk '/^MemTotal/ {{t=$2}} /^MemAvailable/ {{a=$2}} END {{if (t > 0) printf \"mem %d\\n\", ((t-a)/t)*100}}' "
					   "/proc/meminfo; "
					   "echo '---COUNTERS---'; "
					   "awk -v i={} '{{n=$1; sub(/:.*/, \"\", n)}} n == i' /proc/net/dev",
		ShellQuote(PingHost), ShellQuote(WanInterface));
}

std::string WRemoteCommands::FlowCommand() const
{
	std::string Limit{};
	if (MaxFlows > 0)
	{
		Limit = fmt::format(" -L {}", MaxFlows);
	}
	return fmt::format("iftop -i {} -t -s 1 -n -N -P{} 2>/dev/null", ShellQuote(LanInterface), Limit);
}

std::string WRemoteCommands::AddressTableCommand() const
{
	return "echo '---ARP---'; awk 'NR > 1 {print $1, $4, $6}' /proc/net/arp";
}

std::string WRemoteCommands::WirelessCommand() const
{
	return "echo '---WIFI_SCAN---'; "
		   "for iface in $(iw dev | awk '$1 == \"Interface\" {print $2}'); do "
		   "freq=$(iw dev \"$iface\" info | grep -oE '[0-9]+ MHz' | head -n1 | awk '{print $1}'); "
		   "echo \"IFACE $iface $freq\"; "
		   "iw dev \"$iface\" station dump | awk '$1 == \"Station\" {print $2}'; "
		   "done";
}

std::string WRemoteCommands::LeaseCommand() const
{
	return fmt::format("echo '---DHCP---'; cat {}", ShellQuote(LeaseFile));
}
