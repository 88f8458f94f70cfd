/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <vector>

#include "Types.hpp"
#include "Data/DeviceItem.hpp"
#include "Net/SegmentParser.hpp"

// "<timestamp> <mac> <ip> <name> [...]" from the dnsmasq lease file
struct WLeaseRecord
{
	std::string HardwareAddress{};
	std::string NetworkAddress{};
	std::string DisplayName{};
};

// "<ip> <mac> <iface>" from the neighbour table
struct WAddressRecord
{
	std::string NetworkAddress{};
	std::string HardwareAddress{};
	std::string Interface{};
};

struct WStationRecord
{
	std::string         HardwareAddress{};
	EWirelessBand::Type Band{ EWirelessBand::None };
};

// Channel frequencies above this are treated as 5GHz. This is a heuristic,
// some radios report the real band only through their channel table
constexpr WFrequencyMHz DefaultBandThresholdMHz = 4000;

/**
 * Builds the device list from three sources that disagree with each other.
 * Precedence is fixed: leases seed the list (offline, lan), the address table
 * marks devices online and adds devices that have no lease, the wireless dump
 * upgrades known devices to wifi and sets their band. A station that neither
 * of the other sources knows about is dropped.
 *
 * Devices are keyed by hardware address only, the network address of a device
 * may change between polls when its lease is renewed.
 */
class WDeviceReconciler
{
	WFrequencyMHz BandThresholdMHz;

public:
	explicit WDeviceReconciler(WFrequencyMHz BandThresholdMHz_ = DefaultBandThresholdMHz)
		: BandThresholdMHz(BandThresholdMHz_)
	{
	}

	[[nodiscard]] EWirelessBand::Type ClassifyBand(WFrequencyMHz Frequency) const
	{
		return Frequency > BandThresholdMHz ? EWirelessBand::Band5GHz : EWirelessBand::Band2_4GHz;
	}

	static std::vector<WLeaseRecord>   ParseLeases(std::vector<std::string> const& Lines);
	static std::vector<WAddressRecord> ParseAddressTable(std::vector<std::string> const& Lines);

	// "IFACE <name> <freq>" followed by one MAC per line
	[[nodiscard]] std::vector<WStationRecord> ParseWireless(std::vector<std::string> const& Lines) const;

	// Merges and sorts, see the class comment for the precedence
	static std::vector<WDeviceItem> Reconcile(std::vector<WLeaseRecord> const& Leases,
		std::vector<WAddressRecord> const& Addresses, std::vector<WStationRecord> const& Stations);

	// Online first, then by dotted address, unparsable addresses last in their original order
	static void SortDevices(std::vector<WDeviceItem>& Devices);

	// Parses the address, wireless and lease sections and reconciles them. Missing
	// sections count as empty
	[[nodiscard]] std::vector<WDeviceItem> Build(WSectionMap const& Sections) const;

	static std::string PlaceholderName(std::string const& NetworkAddress);
};
