/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DeviceReconciler.hpp"

#include <algorithm>
#include <unordered_map>
#include <spdlog/spdlog.h>

#include "HardwareAddress.hpp"
#include "IPAddress.hpp"
#include "StringUtil.hpp"

namespace
{
	bool IsNetworkAddress(std::string const& Address)
	{
		return WIPAddress::LooksLikeIPv4(Address) || WIPAddress::LooksLikeIPv6(Address);
	}
} // namespace

std::string WDeviceReconciler::PlaceholderName(std::string const& NetworkAddress)
{
	return "Unknown (" + WIPAddress::LastOctet(NetworkAddress) + ")";
}

std::vector<WLeaseRecord> WDeviceReconciler::ParseLeases(std::vector<std::string> const& Lines)
{
	std::vector<WLeaseRecord> Leases{};
	for (auto const& Line : Lines)
	{
		auto const Parts = WStringUtil::SplitWhitespace(Line);
		if (Parts.size() < 4)
		{
			spdlog::trace("Skipping lease line '{}'", Line);
			continue;
		}

		auto Mac = WHardwareAddress::Normalize(Parts[1]);
		if (!Mac || !IsNetworkAddress(Parts[2]))
		{
			spdlog::trace("Skipping lease line '{}'", Line);
			continue;
		}

		WLeaseRecord Lease{ *Mac, Parts[2], Parts[3] };
		if (Lease.DisplayName == "*" || Lease.DisplayName.empty())
		{
			Lease.DisplayName = PlaceholderName(Lease.NetworkAddress);
		}
		Leases.push_back(std::move(Lease));
	}
	return Leases;
}

std::vector<WAddressRecord> WDeviceReconciler::ParseAddressTable(std::vector<std::string> const& Lines)
{
	std::vector<WAddressRecord> Records{};
	for (auto const& Line : Lines)
	{
		auto const Parts = WStringUtil::SplitWhitespace(Line);
		if (Parts.size() < 3)
		{
			spdlog::trace("Skipping address table line '{}'", Line);
			continue;
		}

		// Raw /proc/net/arp header
		if (Parts[0] == "IP")
		{
			continue;
		}

		auto Mac = WHardwareAddress::Normalize(Parts[1]);
		if (!Mac || !IsNetworkAddress(Parts[0]))
		{
			spdlog::trace("Skipping address table line '{}'", Line);
			continue;
		}

		// Incomplete entries show up with an all zero MAC
		if (WHardwareAddress::IsWildcard(*Mac))
		{
			continue;
		}
		Records.push_back({ Parts[0], *Mac, Parts[2] });
	}
	return Records;
}

std::vector<WStationRecord> WDeviceReconciler::ParseWireless(std::vector<std::string> const& Lines) const
{
	std::vector<WStationRecord> Stations{};
	EWirelessBand::Type         CurrentBand = EWirelessBand::None;

	for (auto const& Line : Lines)
	{
		auto const Parts = WStringUtil::SplitWhitespace(Line);
		if (Parts.empty())
		{
			continue;
		}

		if (Parts[0] == "IFACE")
		{
			// A radio without a readable frequency has no usable band, its stations are ignored
			CurrentBand = EWirelessBand::None;
			if (Parts.size() >= 3)
			{
				if (auto Frequency = WStringUtil::ParseUnsigned<WFrequencyMHz>(Parts[2]))
				{
					CurrentBand = ClassifyBand(*Frequency);
				}
			}
			if (CurrentBand == EWirelessBand::None)
			{
				spdlog::trace("Interface line without frequency: '{}'", Line);
			}
			continue;
		}

		if (CurrentBand == EWirelessBand::None)
		{
			spdlog::trace("Station line outside of an interface block: '{}'", Line);
			continue;
		}

		// Either a bare MAC or "Station <mac> (on wlan0)", exactly one MAC per line
		std::optional<std::string> Mac{};
		size_t                     MacCount = 0;
		for (auto const& Part : Parts)
		{
			if (auto Normalized = WHardwareAddress::Normalize(Part))
			{
				Mac = std::move(Normalized);
				++MacCount;
			}
		}
		if (MacCount != 1)
		{
			spdlog::trace("Skipping station line '{}'", Line);
			continue;
		}
		Stations.push_back({ *Mac, CurrentBand });
	}
	return Stations;
}

std::vector<WDeviceItem> WDeviceReconciler::Reconcile(std::vector<WLeaseRecord> const& Leases,
	std::vector<WAddressRecord> const& Addresses, std::vector<WStationRecord> const& Stations)
{
	std::vector<WDeviceItem>                Devices{};
	std::unordered_map<std::string, size_t> IndexByMac{};

	// 1. Leases seed the list, a later lease for the same MAC replaces the earlier one
	for (auto const& Lease : Leases)
	{
		WDeviceItem Device{};
		Device.HardwareAddress = Lease.HardwareAddress;
		Device.NetworkAddress = Lease.NetworkAddress;
		Device.DisplayName = Lease.DisplayName;
		Device.Status = EDeviceStatus::Offline;
		Device.Connection = EConnectionType::Lan;
		Device.Band = EWirelessBand::None;

		if (auto It = IndexByMac.find(Lease.HardwareAddress); It != IndexByMac.end())
		{
			Devices[It->second] = std::move(Device);
		}
		else
		{
			IndexByMac.emplace(Lease.HardwareAddress, Devices.size());
			Devices.push_back(std::move(Device));
		}
	}

	// 2. The address table decides who is online
	for (auto const& Record : Addresses)
	{
		if (auto It = IndexByMac.find(Record.HardwareAddress); It != IndexByMac.end())
		{
			Devices[It->second].Status = EDeviceStatus::Online;
			continue;
		}

		WDeviceItem Device{};
		Device.HardwareAddress = Record.HardwareAddress;
		Device.NetworkAddress = Record.NetworkAddress;
		Device.DisplayName = Record.NetworkAddress;
		Device.Status = EDeviceStatus::Online;
		Device.Connection = EConnectionType::Lan;
		IndexByMac.emplace(Record.HardwareAddress, Devices.size());
		Devices.push_back(std::move(Device));
	}

	// 3. Wireless stations, only for devices the other sources know about
	size_t Dropped = 0;
	for (auto const& Station : Stations)
	{
		auto It = IndexByMac.find(Station.HardwareAddress);
		if (It == IndexByMac.end())
		{
			++Dropped;
			continue;
		}

		auto& Device = Devices[It->second];
		Device.Status = EDeviceStatus::Online;
		Device.Connection = EConnectionType::Wifi;
		Device.Band = Station.Band;
	}

	if (Dropped > 0)
	{
		spdlog::debug("{} wireless stations have no lease or address table entry", Dropped);
	}

	SortDevices(Devices);
	return Devices;
}

void WDeviceReconciler::SortDevices(std::vector<WDeviceItem>& Devices)
{
	std::ranges::stable_sort(Devices, [](WDeviceItem const& A, WDeviceItem const& B) {
		if (A.IsOnline() != B.IsOnline())
		{
			return A.IsOnline();
		}

		auto const QuadA = WIPAddress::ParseDottedQuad(A.NetworkAddress);
		auto const QuadB = WIPAddress::ParseDottedQuad(B.NetworkAddress);
		if (QuadA && QuadB)
		{
			return *QuadA < *QuadB;
		}
		// Parsable addresses come first, two unparsable ones keep their order
		return QuadA.has_value() && !QuadB.has_value();
	});
}

std::vector<WDeviceItem> WDeviceReconciler::Build(WSectionMap const& Sections) const
{
	auto const Leases = ParseLeases(Sections.Get(ESection::Leases));
	auto const Addresses = ParseAddressTable(Sections.Get(ESection::Addresses));
	auto const Stations = ParseWireless(Sections.Get(ESection::Wireless));

	spdlog::debug("Reconciling {} leases, {} address table entries and {} stations", Leases.size(), Addresses.size(),
		Stations.size());
	return Reconcile(Leases, Addresses, Stations);
}
