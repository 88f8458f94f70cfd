/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <spdlog/common.h>

#include "Singleton.hpp"
#include "Types.hpp"

namespace ETransport
{
	enum Type : uint8_t
	{
		Ssh,
		Local // daemon runs on the gateway itself
	};

	inline char const* ToString(Type Transport) { return Transport == Local ? "local" : "ssh"; }
} // namespace ETransport

struct WDaemonConfig final : TSingleton<WDaemonConfig>
{
	// [router]
	std::string      RouterHost{ "10.0.0.1" };
	std::string      RouterUser{ "root" };
	WPort            RouterPort{ 22 };
	std::string      IdentityFile{};
	ETransport::Type Transport{ ETransport::Ssh };
	int              ConnectTimeoutSeconds{ 3 };
	WTimeout         CommandTimeout{ 10000 };

	// [network]
	std::string WanInterface{ "eth0" };
	std::string LanInterface{ "br-lan" };
	std::string PingHost{ "8.8.8.8" };
	std::string LeaseFile{ "/tmp/dhcp.leases" };

	// [classifier]
	std::string   RulesFile{};
	WFrequencyMHz BandThresholdMHz{ 4000 };
	WPort         DefaultPort{ 443 };
	size_t        MaxFlows{ 12 };

	// [daemon]
	WTimeout                  PollInterval{ 2500 };
	std::string               SnapshotPath{ "/tmp/wachposten.json" };
	int                       RateDecimals{ 2 };
	size_t                    DebugHistorySize{ 50 };
	spdlog::level::level_enum LogLevel{ spdlog::level::info };

	WDaemonConfig() = default;

	// Explicit path first, then the working directory, then /etc
	static std::optional<std::string> FindConfigFile(std::string const& ExplicitPath = {});

	// Keys missing from the file keep their current value, invalid values are
	// logged and ignored. False if the file could not be parsed at all
	bool Load(std::string const& Path);

	void LogConfig() const;
};
