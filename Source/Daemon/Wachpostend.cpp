/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Daemon.hpp"
#include "DaemonConfig.hpp"

#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "SignalHandler.hpp"

static void PrintUsage(char const* Program)
{
	std::printf("usage: %s [-c <config.ini>] [--once]\n"
				"  -c <path>  configuration file (default ./wachpostend.ini, /etc/wachposten/wachpostend.ini)\n"
				"  --once     poll a single time and print the snapshot as JSON\n",
		Program);
}

int main(int argc, char** argv)
{
	std::string ConfigPath{};
	bool        bOnce = false;
	for (int i = 1; i < argc; ++i)
	{
		std::string_view const Arg = argv[i];
		if (Arg == "-c" && i + 1 < argc)
		{
			ConfigPath = argv[++i];
		}
		else if (Arg == "--once")
		{
			bOnce = true;
		}
		else if (Arg == "-h" || Arg == "--help")
		{
			PrintUsage(argv[0]);
			return 0;
		}
		else
		{
			spdlog::error("Unknown argument '{}'", Arg);
			PrintUsage(argv[0]);
			return -1;
		}
	}

	if (bOnce)
	{
		// stdout carries the JSON document
		spdlog::set_default_logger(spdlog::stderr_color_mt("wachpostend"));
	}

	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	auto& Config = WDaemonConfig::GetInstance();
	if (auto Path = WDaemonConfig::FindConfigFile(ConfigPath))
	{
		if (!Config.Load(*Path))
		{
			return -1;
		}
	}
	else if (!ConfigPath.empty())
	{
		return -1;
	}
	else
	{
		spdlog::info("no configuration file found, using defaults");
	}
	spdlog::set_level(Config.LogLevel);

	spdlog::info("Wachposten daemon starting");
	Config.LogConfig();

	// Installs the SIGINT/SIGTERM handlers
	WSignalHandler::GetInstance();

	auto& Daemon = WDaemon::GetInstance();
	if (!Daemon.Init(Config))
	{
		return -1;
	}

	if (bOnce)
	{
		auto const Snapshot = Daemon.PollOnce();
		std::string Json{};
		try
		{
			Json = WDaemon::ToJson(Snapshot);
		}
		catch (std::exception const& e)
		{
			spdlog::error("Failed to serialize snapshot: {}", e.what());
			return -1;
		}
		std::printf("%s\n", Json.c_str());
		return Snapshot.IsAvailable() ? 0 : 1;
	}

	Daemon.RunLoop();
	spdlog::info("Wachposten daemon stopped");
	return 0;
}
