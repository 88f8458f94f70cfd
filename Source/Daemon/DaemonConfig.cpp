/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DaemonConfig.hpp"

#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "StringUtil.hpp"

std::optional<std::string> WDaemonConfig::FindConfigFile(std::string const& ExplicitPath)
{
	if (!ExplicitPath.empty())
	{
		if (WFilesystem::Exists(ExplicitPath))
		{
			return ExplicitPath;
		}
		spdlog::error("configuration file '{}' does not exist", ExplicitPath);
		return std::nullopt;
	}

	for (auto const* Candidate : { "./wachpostend.ini", "/etc/wachposten/wachpostend.ini" })
	{
		if (WFilesystem::Exists(Candidate))
		{
			return std::string(Candidate);
		}
	}
	return std::nullopt;
}

void WDaemonConfig::LogConfig() const
{
	if (Transport == ETransport::Local)
	{
		spdlog::info("transport=local");
	}
	else
	{
		spdlog::info("router={}@{}:{} (connect timeout {}s)", RouterUser, RouterHost, RouterPort, ConnectTimeoutSeconds);
	}
	spdlog::info("wan interface={}, lan interface={}", WanInterface, LanInterface);
	spdlog::info("poll interval={}ms, command timeout={}ms", PollInterval.count(), CommandTimeout.count());
	spdlog::info("rules={}", RulesFile.empty() ? "built-in" : RulesFile);
	spdlog::info("snapshot path={}", SnapshotPath);
}

bool WDaemonConfig::Load(std::string const& Path)
{
	INIReader Reader(Path);

	if (Reader.ParseError() != 0)
	{
		spdlog::error("can't load '{}': {}", Path, Reader.ParseErrorMessage());
		return false;
	}

	auto SafeGet = [&](std::string const& Section, std::string const& Name, std::string& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = Reader.Get(Section, Name, OutVal);
		}
	};

	// Integers with a lower bound, anything else keeps the default
	auto SafeGetNumber = [&]<typename T>(std::string const& Section, std::string const& Name, T& OutVal, long Min,
							 long Max) {
		if (!Reader.HasValue(Section, Name))
		{
			return;
		}
		auto Raw = WStringUtil::Trim(Reader.Get(Section, Name, ""));
		auto Value = WStringUtil::ParseUnsigned<unsigned long>(Raw);
		if (!Value || static_cast<long>(*Value) < Min || static_cast<long>(*Value) > Max)
		{
			spdlog::warn("{}.{}: '{}' is not a number in [{}, {}], keeping {}", Section, Name, Raw, Min, Max, OutVal);
			return;
		}
		OutVal = static_cast<T>(*Value);
	};

	auto SafeGetTimeout = [&](std::string const& Section, std::string const& Name, WTimeout& OutVal) {
		long Millis = static_cast<long>(OutVal.count());
		SafeGetNumber(Section, Name, Millis, 1, 3600 * 1000);
		OutVal = WTimeout(Millis);
	};

	SafeGet("router", "host", RouterHost);
	SafeGet("router", "user", RouterUser);
	SafeGetNumber("router", "port", RouterPort, 1, 65535);
	SafeGet("router", "identity_file", IdentityFile);
	SafeGetNumber("router", "connect_timeout_s", ConnectTimeoutSeconds, 1, 600);
	SafeGetTimeout("router", "command_timeout_ms", CommandTimeout);

	if (Reader.HasValue("router", "transport"))
	{
		auto Value = WStringUtil::ToLower(Reader.Get("router", "transport", ""));
		if (Value == "local")
		{
			Transport = ETransport::Local;
		}
		else if (Value == "ssh")
		{
			Transport = ETransport::Ssh;
		}
		else
		{
			spdlog::warn("router.transport: unknown transport '{}', using {}", Value, ETransport::ToString(Transport));
		}
	}

	SafeGet("network", "wan_interface", WanInterface);
	SafeGet("network", "lan_interface", LanInterface);
	SafeGet("network", "ping_host", PingHost);
	SafeGet("network", "lease_file", LeaseFile);

	SafeGet("classifier", "rules_file", RulesFile);
	SafeGetNumber("classifier", "band_threshold_mhz", BandThresholdMHz, 1, 100000);
	SafeGetNumber("classifier", "default_port", DefaultPort, 1, 65535);
	SafeGetNumber("classifier", "max_flows", MaxFlows, 0, 10000);

	SafeGetTimeout("daemon", "poll_interval_ms", PollInterval);
	SafeGet("daemon", "snapshot_path", SnapshotPath);
	SafeGetNumber("daemon", "rate_decimals", RateDecimals, 0, 6);
	SafeGetNumber("daemon", "debug_history", DebugHistorySize, 1, 10000);

	if (Reader.HasValue("daemon", "log_level"))
	{
		auto const Name = WStringUtil::ToLower(Reader.Get("daemon", "log_level", ""));
		auto const Level = spdlog::level::from_str(Name);
		// from_str() maps unknown names to off
		if (Level == spdlog::level::off && Name != "off")
		{
			spdlog::warn("daemon.log_level: unknown level '{}'", Name);
		}
		else
		{
			LogLevel = Level;
		}
	}

	spdlog::info("loaded configuration from '{}'", Path);
	return true;
}
