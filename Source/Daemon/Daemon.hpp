/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <string>

#include "DaemonConfig.hpp"
#include "DebugHistory.hpp"
#include "Poller.hpp"
#include "Singleton.hpp"
#include "Data/Snapshot.hpp"
#include "Remote/IRemoteExecutor.hpp"

class WDaemon : public TSingleton<WDaemon>
{
	std::unique_ptr<WDebugHistory>   DebugHistory{};
	std::unique_ptr<IRemoteExecutor> Executor{};
	std::unique_ptr<WPoller>         Poller{};
	std::string                      SnapshotPath{};
	WTimeout                         PollInterval{};

public:
	~WDaemon() override;

	bool Init(WDaemonConfig const& Config);

	// Polls and writes the snapshot until SIGINT/SIGTERM
	void RunLoop();

	WSnapshot PollOnce();

	static std::unique_ptr<IRemoteExecutor> MakeExecutor(WDaemonConfig const& Config);
	static WClassificationRules             LoadRules(WDaemonConfig const& Config);

	// Top level JSON object, keys as read by the dashboard
	static std::string ToJson(WSnapshot const& Snapshot);

	bool WriteSnapshot(WSnapshot const& Snapshot) const;

	[[nodiscard]] WDebugHistory* GetDebugHistory() const { return DebugHistory.get(); }
};
