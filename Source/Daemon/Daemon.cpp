/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Daemon.hpp"

#include <sstream>
#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "SignalHandler.hpp"
#include "Remote/ProcessExecutor.hpp"

WDaemon::~WDaemon()
{
	// The poller logs through the history sink, tear it down first
	Poller.reset();
	if (DebugHistory)
	{
		DebugHistory->Detach();
	}
}

std::unique_ptr<IRemoteExecutor> WDaemon::MakeExecutor(WDaemonConfig const& Config)
{
	if (Config.Transport == ETransport::Local)
	{
		return std::make_unique<WLocalExecutor>();
	}

	WSshTarget Target{};
	Target.Host = Config.RouterHost;
	Target.User = Config.RouterUser;
	Target.Port = Config.RouterPort;
	Target.IdentityFile = Config.IdentityFile;
	Target.ConnectTimeoutSeconds = Config.ConnectTimeoutSeconds;
	return std::make_unique<WSshExecutor>(std::move(Target));
}

WClassificationRules WDaemon::LoadRules(WDaemonConfig const& Config)
{
	if (Config.RulesFile.empty())
	{
		return WClassificationRules::BuiltIn();
	}

	if (auto Rules = WClassificationRules::LoadFromFile(Config.RulesFile))
	{
		return std::move(*Rules);
	}

	spdlog::warn("No usable rules in '{}', using the built-in table", Config.RulesFile);
	return WClassificationRules::BuiltIn();
}

bool WDaemon::Init(WDaemonConfig const& Config)
{
	if (Poller)
	{
		spdlog::warn("Daemon already initialized");
		return true;
	}

	DebugHistory = std::make_unique<WDebugHistory>(Config.DebugHistorySize);
	DebugHistory->AttachTo();

	Executor = MakeExecutor(Config);
	Poller = std::make_unique<WPoller>(*Executor, Config, LoadRules(Config), DebugHistory.get());
	SnapshotPath = Config.SnapshotPath;
	PollInterval = Config.PollInterval;

	spdlog::info("Polling {} every {}ms", Executor->Describe(), PollInterval.count());
	return true;
}

WSnapshot WDaemon::PollOnce()
{
	return Poller->Poll();
}

std::string WDaemon::ToJson(WSnapshot const& Snapshot)
{
	std::ostringstream Os;
	{
		cereal::JSONOutputArchive Archive(Os);
		// Written into the root object instead of a nested "value0"
		Snapshot.save(Archive);
	}
	return Os.str();
}

bool WDaemon::WriteSnapshot(WSnapshot const& Snapshot) const
{
	std::string Json{};
	try
	{
		Json = ToJson(Snapshot);
	}
	catch (std::exception const& e)
	{
		spdlog::error("Failed to serialize snapshot: {}", e.what());
		return false;
	}
	return WFilesystem::WriteFileAtomically(SnapshotPath, Json);
}

void WDaemon::RunLoop()
{
	WSignalHandler const& SignalHandler = WSignalHandler::GetInstance();

	while (!SignalHandler.bStop)
	{
		auto const Start = std::chrono::steady_clock::now();
		auto const Snapshot = PollOnce();
		if (!WriteSnapshot(Snapshot))
		{
			spdlog::warn("Snapshot of {} was not published", Snapshot.Time);
		}

		// The interval is measured from the start of the poll, a slow gateway does not stretch it
		auto const Elapsed =
			std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - Start);
		if (Elapsed < PollInterval && !SignalHandler.SleepFor(PollInterval - Elapsed))
		{
			break;
		}
	}
}
