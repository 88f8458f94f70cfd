/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <string>
#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>

namespace EDeviceStatus
{
	enum Type : uint8_t
	{
		Online,
		Offline
	};

	inline char const* ToString(Type Status) { return Status == Online ? "online" : "offline"; }
} // namespace EDeviceStatus

namespace EConnectionType
{
	enum Type : uint8_t
	{
		Unknown,
		Lan,
		Wifi
	};

	inline char const* ToString(Type Connection)
	{
		switch (Connection)
		{
			case Lan:
				return "lan";
			case Wifi:
				return "wifi";
			case Unknown:
			default:
				return "unknown";
		}
	}
} // namespace EConnectionType

namespace EWirelessBand
{
	enum Type : uint8_t
	{
		None,
		Band2_4GHz,
		Band5GHz
	};

	inline char const* ToString(Type Band)
	{
		switch (Band)
		{
			case Band2_4GHz:
				return "2.4g";
			case Band5GHz:
				return "5g";
			case None:
			default:
				return "";
		}
	}
} // namespace EWirelessBand

// One device on the gateway's network, keyed by hardware address
struct WDeviceItem
{
	std::string           HardwareAddress{};
	std::string           NetworkAddress{};
	std::string           DisplayName{};
	EDeviceStatus::Type   Status{ EDeviceStatus::Offline };
	EConnectionType::Type Connection{ EConnectionType::Lan };
	EWirelessBand::Type   Band{ EWirelessBand::None };

	[[nodiscard]] bool IsOnline() const { return Status == EDeviceStatus::Online; }

	template <class Archive>
	void save(Archive& archive) const
	{
		archive(cereal::make_nvp("mac", HardwareAddress), cereal::make_nvp("ip", NetworkAddress),
			cereal::make_nvp("hostname", DisplayName),
			cereal::make_nvp("status", std::string(EDeviceStatus::ToString(Status))),
			cereal::make_nvp("connection", std::string(EConnectionType::ToString(Connection))),
			cereal::make_nvp("band", std::string(EWirelessBand::ToString(Band))));
	}
};
