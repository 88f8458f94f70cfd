/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <catch2/catch.hpp>
#include <algorithm>
#include <atomic>
#include <spdlog/fmt/fmt.h>

#include "Daemon.hpp"
#include "Poller.hpp"
#include "ScriptedExecutor.hpp"

namespace
{
	std::string MetricsOutput(WBytes Rx, WBytes Tx)
	{
		return fmt::format("---SYSTEM---\n"
						   "load 0.42\n"
						   "ping 12.3\n"
						   "temp 51234\n"
						   "mem 37\n"
						   "---COUNTERS---\n"
						   "  eth0: {} 10 0 0 0 0 0 0 {} 20 0 0 0 0 0 0\n",
			Rx, Tx);
	}

	constexpr char const* FlowOutput = "   1 192.168.1.10:51234  =>  1.50Kb  1.20Kb  1.10Kb  5.31KB\n"
									   "     142.250.10.5:443    <=  12.4Kb  10.1Kb  9.80Kb  48.2KB\n";

	constexpr char const* AddressOutput = "---ARP---\n"
										  "10.0.0.5 aa:bb:cc:00:00:05 br-lan\n";

	constexpr char const* WirelessOutput = "---WIFI_SCAN---\n"
										   "IFACE phy0-ap0 5180\n"
										   "aa:bb:cc:00:00:05\n";

	constexpr char const* LeaseOutput = "---DHCP---\n"
										"1700000000 aa:bb:cc:00:00:05 10.0.0.5 laptop *\n"
										"1700000000 aa:bb:cc:00:00:20 10.0.0.20 printer *\n";

	void ScriptHealthyGateway(WScriptedExecutor& Executor, WBytes Rx = 1000, WBytes Tx = 500)
	{
		Executor.On("---SYSTEM---", WCommandResult::Success(MetricsOutput(Rx, Tx)));
		Executor.On("iftop", WCommandResult::Success(FlowOutput));
		Executor.On("---ARP---", WCommandResult::Success(AddressOutput));
		Executor.On("---WIFI_SCAN---", WCommandResult::Success(WirelessOutput));
		Executor.On("---DHCP---", WCommandResult::Success(LeaseOutput));
	}

	bool IsDegraded(WSnapshot const& Snapshot, std::string const& Section)
	{
		return std::ranges::find(Snapshot.DegradedSections, Section) != Snapshot.DegradedSections.end();
	}
} // namespace

TEST_CASE("A healthy gateway yields a complete snapshot", "[poller]")
{
	WScriptedExecutor   Executor{};
	WDaemonConfig const Config{};
	ScriptHealthyGateway(Executor);
	WPoller Poller(Executor, Config, WClassificationRules::BuiltIn());

	auto const Snapshot = Poller.Poll();

	REQUIRE(Snapshot.IsAvailable());
	REQUIRE(Snapshot.DegradedSections.empty());
	REQUIRE(Snapshot.Readings.Load == "0.42");
	REQUIRE(Snapshot.Readings.TemperatureString() == "51.2");
	REQUIRE(Snapshot.Time.size() == 8);

	REQUIRE(Snapshot.Devices.size() == 2);
	REQUIRE(Snapshot.Devices[0].DisplayName == "laptop");
	REQUIRE(Snapshot.Devices[0].Connection == EConnectionType::Wifi);
	REQUIRE(Snapshot.Devices[0].Band == EWirelessBand::Band5GHz);
	REQUIRE(Snapshot.Devices[1].DisplayName == "printer");
	REQUIRE(Snapshot.Devices[1].Status == EDeviceStatus::Offline);

	REQUIRE(Snapshot.Flows.size() == 1);
	REQUIRE(Snapshot.Flows[0].Classification.Label == "GOOGLE");

	SECTION("the first poll reports no throughput")
	{
		REQUIRE(Snapshot.Rates.DownloadMbps == 0.0);
		REQUIRE(Snapshot.Rates.UploadMbps == 0.0);
		REQUIRE(Snapshot.Rates.TotalMbps == 0.0);
	}

	SECTION("every collaborator call is issued once")
	{
		REQUIRE(Executor.GetCommands().size() == ERemoteCall::Count);
	}
}

TEST_CASE("Rates come from consecutive polls", "[poller]")
{
	WScriptedExecutor   Executor{};
	WDaemonConfig const Config{};
	ScriptHealthyGateway(Executor, 1000, 500);
	WSeconds Now = 0.0;
	WPoller  Poller(Executor, Config, WClassificationRules::BuiltIn(), nullptr, [&Now] { return Now; });

	auto const First = Poller.Poll();
	REQUIRE(First.Rates.RawDownloadMbps == 0.0);

	Now = 1.0;
	Executor.On("---SYSTEM---", WCommandResult::Success(MetricsOutput(1500, 400)));
	auto const Second = Poller.Poll();

	REQUIRE(Second.Rates.RawDownloadMbps == Approx(500.0 * 8.0 / 1048576.0));
	REQUIRE(Second.Rates.RawUploadMbps == 0.0);
	REQUIRE(Second.Rates.UploadMbps == 0.0);
}

TEST_CASE("Rates are timed by when the counters came back", "[poller]")
{
	WScriptedExecutor   Executor{};
	WDaemonConfig const Config{};
	ScriptHealthyGateway(Executor, 0, 0);

	// The clock moves while the metrics call is in flight
	std::atomic<WSeconds> Now{ 0.0 };
	Executor.OnRun("---SYSTEM---", [&Now] { Now = 0.05; });
	WPoller Poller(Executor, Config, WClassificationRules::BuiltIn(), nullptr, [&Now] { return Now.load(); });

	REQUIRE(Poller.Poll().Rates.TotalMbps == 0.0);
	REQUIRE(Poller.GetRateTracker().GetPrevious()->Timestamp == Approx(0.05));

	// Next poll starts on schedule but the call stalls on the ping for two seconds
	Now = 2.5;
	Executor.OnRun("---SYSTEM---", [&Now] { Now = 4.55; });
	WBytes const Received = 1048576 / 8 * 9 / 2;
	Executor.On("---SYSTEM---", WCommandResult::Success(MetricsOutput(Received, 0)));

	auto const Snapshot = Poller.Poll();

	// 4.5 seconds between the two readings at 1 Mbps
	REQUIRE(Snapshot.Rates.RawDownloadMbps == Approx(1.0));
	REQUIRE(Snapshot.Rates.DownloadMbps == 1.0);
	REQUIRE(Poller.GetRateTracker().GetPrevious()->Timestamp == Approx(4.55));
}

TEST_CASE("A wireless timeout only empties the wireless data", "[poller]")
{
	WScriptedExecutor   Executor{};
	WDaemonConfig const Config{};
	ScriptHealthyGateway(Executor);
	Executor.On("---ARP---", WCommandResult::Success("---ARP---\n"));
	Executor.On("---WIFI_SCAN---", WCommandResult::Failure(ECommandError::Timeout, "timed out after 10000ms"));
	WPoller Poller(Executor, Config, WClassificationRules::BuiltIn());

	auto const Snapshot = Poller.Poll();

	REQUIRE(Snapshot.IsAvailable());
	REQUIRE(IsDegraded(Snapshot, "wireless"));
	REQUIRE(Snapshot.DegradedSections.size() == 1);

	REQUIRE(Snapshot.Devices.size() == 2);
	for (auto const& Device : Snapshot.Devices)
	{
		REQUIRE(Device.Status == EDeviceStatus::Offline);
		REQUIRE(Device.Connection == EConnectionType::Lan);
		REQUIRE(Device.Band == EWirelessBand::None);
	}
	REQUIRE(Snapshot.Flows.size() == 1);
}

TEST_CASE("A failed metrics call makes the poll unavailable", "[poller]")
{
	WScriptedExecutor   Executor{};
	WDaemonConfig const Config{};
	ScriptHealthyGateway(Executor);
	Executor.On("---SYSTEM---", WCommandResult::Failure(ECommandError::TransportError, "exited with status 255", 255));
	WPoller Poller(Executor, Config, WClassificationRules::BuiltIn());

	auto const Snapshot = Poller.Poll();

	REQUIRE_FALSE(Snapshot.IsAvailable());
	REQUIRE_THAT(Snapshot.Error, Catch::Matchers::Contains("metrics"));
	REQUIRE_THAT(Snapshot.Error, Catch::Matchers::Contains("transport error"));
	REQUIRE(Snapshot.Devices.empty());
	REQUIRE(Snapshot.Flows.empty());

	SECTION("the rate baseline is not touched")
	{
		REQUIRE_FALSE(Poller.GetRateTracker().GetPrevious().has_value());
	}

	SECTION("the gateway coming back starts a fresh baseline")
	{
		Executor.On("---SYSTEM---", WCommandResult::Success(MetricsOutput(1000, 500)));
		auto const Recovered = Poller.Poll();
		REQUIRE(Recovered.IsAvailable());
		REQUIRE(Recovered.Rates.TotalMbps == 0.0);
	}
}

TEST_CASE("Failures of the other calls degrade their sections only", "[poller]")
{
	WScriptedExecutor   Executor{};
	WDaemonConfig const Config{};
	ScriptHealthyGateway(Executor);

	SECTION("flow sampler")
	{
		Executor.On("iftop", WCommandResult::Failure(ECommandError::NonZeroExit, "exited with status 1", 1));
		WPoller    Poller(Executor, Config, WClassificationRules::BuiltIn());
		auto const Snapshot = Poller.Poll();

		REQUIRE(Snapshot.IsAvailable());
		REQUIRE(IsDegraded(Snapshot, "flows"));
		REQUIRE(Snapshot.Flows.empty());
		REQUIRE(Snapshot.Devices.size() == 2);
	}

	SECTION("lease table")
	{
		Executor.On("---DHCP---", WCommandResult::Failure(ECommandError::NonZeroExit, "exited with status 1", 1));
		WPoller    Poller(Executor, Config, WClassificationRules::BuiltIn());
		auto const Snapshot = Poller.Poll();

		REQUIRE(IsDegraded(Snapshot, "leases"));
		// The device known from the address table is still there, named by its address
		REQUIRE(Snapshot.Devices.size() == 1);
		REQUIRE(Snapshot.Devices[0].DisplayName == "10.0.0.5");
		REQUIRE(Snapshot.Devices[0].Connection == EConnectionType::Wifi);
	}

	SECTION("a call that succeeds without printing its marker")
	{
		Executor.On("---DHCP---", WCommandResult::Success(""));
		WPoller    Poller(Executor, Config, WClassificationRules::BuiltIn());
		auto const Snapshot = Poller.Poll();

		REQUIRE(Snapshot.IsAvailable());
		REQUIRE(IsDegraded(Snapshot, "leases"));
	}

	SECTION("lines of a call without its marker do not leak into other sections")
	{
		// Read on its own this line would look like a station of the radio above
		Executor.On("---DHCP---", WCommandResult::Success("1700000000 aa:bb:cc:00:00:05 10.0.0.5 laptop *\n"));
		Executor.On("---WIFI_SCAN---", WCommandResult::Success("---WIFI_SCAN---\n"
															  "IFACE phy0-ap0 5180\n"
															  "---DHCP---\n"
															  "1700000000 aa:bb:cc:00:00:30 10.0.0.30 ghost *\n"));
		WPoller    Poller(Executor, Config, WClassificationRules::BuiltIn());
		auto const Snapshot = Poller.Poll();

		REQUIRE(IsDegraded(Snapshot, "leases"));
		// Only the address table knows the device, nothing marks it wifi
		REQUIRE(Snapshot.Devices.size() == 1);
		REQUIRE(Snapshot.Devices[0].HardwareAddress == "aa:bb:cc:00:00:05");
		REQUIRE(Snapshot.Devices[0].DisplayName == "10.0.0.5");
		REQUIRE(Snapshot.Devices[0].Connection == EConnectionType::Lan);
		REQUIRE(Snapshot.Devices[0].Band == EWirelessBand::None);
	}

	SECTION("missing WAN counters")
	{
		Executor.On("---SYSTEM---", WCommandResult::Success("---SYSTEM---\nload 1.00\n"));
		WPoller    Poller(Executor, Config, WClassificationRules::BuiltIn());
		auto const Snapshot = Poller.Poll();

		REQUIRE(Snapshot.IsAvailable());
		REQUIRE(IsDegraded(Snapshot, "counters"));
		REQUIRE(Snapshot.Readings.Load == "1.00");
		REQUIRE(Snapshot.Rates.TotalMbps == 0.0);
	}
}

TEST_CASE("Configuration reaches the parsers", "[poller]")
{
	WScriptedExecutor Executor{};
	WDaemonConfig     Config{};
	Config.BandThresholdMHz = 6000;
	Config.MaxFlows = 0;
	ScriptHealthyGateway(Executor);
	WPoller Poller(Executor, Config, WClassificationRules::BuiltIn());

	auto const Snapshot = Poller.Poll();
	REQUIRE(Snapshot.Devices[0].Band == EWirelessBand::Band2_4GHz);

	auto const Commands = Executor.GetCommands();
	auto const Flow = std::ranges::find_if(Commands, [](std::string const& C) { return C.starts_with("iftop"); });
	REQUIRE(Flow != Commands.end());
	REQUIRE_THAT(*Flow, !Catch::Matchers::Contains("-L"));
}

TEST_CASE("Snapshots serialize to the dashboard JSON", "[poller][json]")
{
	WScriptedExecutor   Executor{};
	WDaemonConfig const Config{};
	ScriptHealthyGateway(Executor);
	WPoller Poller(Executor, Config, WClassificationRules::BuiltIn());

	SECTION("online")
	{
		auto const Json = WDaemon::ToJson(Poller.Poll());
		for (auto const* Key : { "\"status\"", "\"load\"", "\"ping\"", "\"temp\"", "\"memory\"", "\"download_mbps\"",
				 "\"upload_mbps\"", "\"total_mbps\"", "\"iftop\"", "\"devices\"", "\"time\"", "\"debug_logs\"",
				 "\"mac\"", "\"hostname\"", "\"connection\"", "\"band\"", "\"last_2s\"", "\"label\"" })
		{
			REQUIRE_THAT(Json, Catch::Matchers::Contains(Key));
		}
		REQUIRE_THAT(Json, Catch::Matchers::Contains("\"Online\""));
		REQUIRE_THAT(Json, Catch::Matchers::Contains("\"5g\""));
		REQUIRE_THAT(Json, Catch::Matchers::Contains("\"aa:bb:cc:00:00:05\""));
		REQUIRE_THAT(Json, Catch::Matchers::Contains("\"48.2KB\""));
		// Top level object, not wrapped by the archive
		REQUIRE_THAT(Json, !Catch::Matchers::Contains("value0"));
	}

	SECTION("offline")
	{
		Executor.On("---SYSTEM---", WCommandResult::Failure(ECommandError::Timeout, "timed out"));
		auto const Json = WDaemon::ToJson(Poller.Poll());
		REQUIRE_THAT(Json, Catch::Matchers::Contains("\"Offline\""));
		REQUIRE_THAT(Json, Catch::Matchers::Contains("\"error\""));
		REQUIRE_THAT(Json, !Catch::Matchers::Contains("\"devices\""));
	}
}
