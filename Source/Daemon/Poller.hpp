/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <array>
#include <functional>

#include "DaemonConfig.hpp"
#include "DebugHistory.hpp"
#include "Time.hpp"
#include "Types.hpp"
#include "Data/DeviceReconciler.hpp"
#include "Data/RateTracker.hpp"
#include "Data/Snapshot.hpp"
#include "Net/FlowPairParser.hpp"
#include "Net/SegmentParser.hpp"
#include "Net/TrafficClassifier.hpp"
#include "Remote/IRemoteExecutor.hpp"
#include "Remote/RemoteCommands.hpp"

/**
 * One poll issues the collaborator calls concurrently, each bounded by the
 * command timeout, and builds a snapshot from whatever came back. Only a
 * failed metrics call makes the snapshot unavailable, every other failure
 * empties its own section and is listed in DegradedSections.
 *
 * The executor has to be usable from several threads at once.
 */
class WPoller
{
	IRemoteExecutor&     Executor;
	WRemoteCommands      Commands;
	WTimeout             CommandTimeout;
	size_t               MaxFlows;
	WSegmentParser       SegmentParser;
	WTrafficClassifier   Classifier;
	WFlowPairParser      FlowParser;
	WDeviceReconciler    Reconciler;
	WRateTracker         RateTracker;
	WDebugHistory const* DebugHistory;

public:
	// Monotonic seconds
	using WClock = std::function<WSeconds()>;

private:
	WClock Clock;

	using WCallResults = std::array<WCommandResult, ERemoteCall::Count>;

	// MetricsTime is taken when the metrics call returns, the counters are the last thing it reads
	WCallResults RunCalls(WSeconds& MetricsTime);

	// Fills readings and rates, false if the metrics call is unusable
	bool CollectMetrics(WCommandResult const& Result, WSeconds Now, WSnapshot& Snapshot);
	void CollectDevices(WCallResults const& Results, WSnapshot& Snapshot) const;
	void CollectFlows(WCommandResult const& Result, WSnapshot& Snapshot) const;

public:
	WPoller(IRemoteExecutor& Executor_, WDaemonConfig const& Config, WClassificationRules const& Rules,
		WDebugHistory const* DebugHistory_ = nullptr, WClock Clock_ = &WTime::GetMonotonicSeconds);

	WPoller(WPoller const&) = delete;
	WPoller& operator=(WPoller const&) = delete;

	WSnapshot Poll();

	[[nodiscard]] WRateTracker const& GetRateTracker() const { return RateTracker; }
};
