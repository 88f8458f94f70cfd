/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <catch2/catch.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>

#include "Net/MetricsParser.hpp"
#include "Net/SegmentParser.hpp"
#include "Remote/ProcessExecutor.hpp"
#include "Remote/RemoteCommands.hpp"

using namespace std::chrono_literals;

TEST_CASE("Configuration values are quoted for the remote shell", "[commands]")
{
	REQUIRE(WRemoteCommands::ShellQuote("br-lan") == "'br-lan'");
	REQUIRE(WRemoteCommands::ShellQuote("it's") == "'it'\\''s'");
	REQUIRE(WRemoteCommands::ShellQuote("") == "''");

	WDaemonConfig Config{};
	Config.LeaseFile = "/tmp/dhcp leases";
	WRemoteCommands const Commands(Config);
	REQUIRE_THAT(Commands.LeaseCommand(), Catch::Matchers::EndsWith("cat '/tmp/dhcp leases'"));
}

TEST_CASE("Every device command prints its own marker first", "[commands]")
{
	WDaemonConfig const   Config{};
	WRemoteCommands const Commands(Config);

	REQUIRE_THAT(Commands.Get(ERemoteCall::Metrics), Catch::Matchers::StartsWith("echo '---SYSTEM---'"));
	REQUIRE_THAT(Commands.Get(ERemoteCall::Metrics), Catch::Matchers::Contains("---COUNTERS---"));
	REQUIRE_THAT(Commands.Get(ERemoteCall::Addresses), Catch::Matchers::StartsWith("echo '---ARP---'"));
	REQUIRE_THAT(Commands.Get(ERemoteCall::Wireless), Catch::Matchers::StartsWith("echo '---WIFI_SCAN---'"));
	REQUIRE_THAT(Commands.Get(ERemoteCall::Leases), Catch::Matchers::StartsWith("echo '---DHCP---'"));
	REQUIRE_THAT(Commands.Get(ERemoteCall::Flows), Catch::Matchers::Contains("-i 'br-lan'"));
	REQUIRE_THAT(Commands.Get(ERemoteCall::Flows), Catch::Matchers::Contains("-L 12"));
}

TEST_CASE("The WAN counters are the last thing the metrics command reads", "[commands]")
{
	WDaemonConfig const   Config{};
	WRemoteCommands const Commands(Config);
	auto const            Command = Commands.SystemCommand();

	auto const Counters = Command.find("/proc/net/dev");
	REQUIRE(Counters != std::string::npos);
	REQUIRE(Counters > Command.find("ping"));
	REQUIRE(Counters > Command.find("/proc/meminfo"));
	REQUIRE(Command.find(';', Counters) == std::string::npos);
}

TEST_CASE("The lease command output parses into the lease section", "[commands][integration]")
{
	auto const Path = std::filesystem::temp_directory_path() /
		("wachposten-leases-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
	{
		std::ofstream Output(Path);
		REQUIRE(Output.good());
		Output << "1700000000 aa:bb:cc:00:00:05 10.0.0.5 laptop *\n";
	}

	WDaemonConfig Config{};
	Config.LeaseFile = Path.string();
	WRemoteCommands const Commands(Config);
	WLocalExecutor        Executor{};

	auto const Result = Executor.Execute(Commands.LeaseCommand(), 5s);
	std::filesystem::remove(Path);

	REQUIRE(Result.Ok());
	auto const Sections = WSegmentParser(WSegmentParser::DefaultMarkers()).Parse(Result.Output);
	REQUIRE(Sections.Get(ESection::Leases) == std::vector<std::string>{ "1700000000 aa:bb:cc:00:00:05 10.0.0.5 laptop *" });

	SECTION("a missing lease file is a failed call")
	{
		auto const Missing = Executor.Execute(Commands.LeaseCommand(), 5s);
		REQUIRE(Missing.Error == ECommandError::NonZeroExit);
	}
}

TEST_CASE("The metrics command runs on a Linux host", "[commands][integration]")
{
	WDaemonConfig Config{};
	// Always present in /proc/net/dev
	Config.WanInterface = "lo";
	Config.PingHost = "127.0.0.1";
	WRemoteCommands const Commands(Config);
	WLocalExecutor        Executor{};

	auto const Result = Executor.Execute(Commands.SystemCommand(), 10s);
	REQUIRE(Result.Ok());

	auto const Sections = WSegmentParser(WSegmentParser::DefaultMarkers()).Parse(Result.Output);
	REQUIRE(Sections.HasSection(ESection::System));
	REQUIRE(Sections.HasSection(ESection::Counters));
	REQUIRE(WMetricsParser::ParseCounters(Sections.Get(ESection::Counters)).has_value());

	auto const Readings = WMetricsParser::ParseSystem(Sections.Get(ESection::System));
	REQUIRE(Readings.Load != "0");
}
