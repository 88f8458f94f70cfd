/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Poller.hpp"

#include <future>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "Time.hpp"
#include "Net/MetricsParser.hpp"

namespace
{
	std::string DescribeFailure(ERemoteCall::Type Call, WCommandResult const& Result)
	{
		if (Result.Message.empty())
		{
			return fmt::format("{} call failed: {}", ERemoteCall::ToString(Call), ECommandError::ToString(Result.Error));
		}
		return fmt::format("{} call failed: {} ({})", ERemoteCall::ToString(Call),
			ECommandError::ToString(Result.Error), Result.Message);
	}
} // namespace

WPoller::WPoller(IRemoteExecutor& Executor_, WDaemonConfig const& Config, WClassificationRules const& Rules,
	WDebugHistory const* DebugHistory_, WClock Clock_)
	: Executor(Executor_)
	, Commands(Config)
	, CommandTimeout(Config.CommandTimeout)
	, MaxFlows(Config.MaxFlows)
	, SegmentParser(WSegmentParser::DefaultMarkers())
	, Classifier(Rules)
	, FlowParser(Classifier, Config.DefaultPort)
	, Reconciler(Config.BandThresholdMHz)
	, RateTracker(Config.RateDecimals)
	, DebugHistory(DebugHistory_)
	, Clock(std::move(Clock_))
{
}

WPoller::WCallResults WPoller::RunCalls(WSeconds& MetricsTime)
{
	std::array<std::future<std::pair<WCommandResult, WSeconds>>, ERemoteCall::Count> Pending{};
	for (size_t i = 0; i < ERemoteCall::Count; ++i)
	{
		auto const Call = static_cast<ERemoteCall::Type>(i);
		Pending[i] = std::async(std::launch::async, [this, Command = Commands.Get(Call)] {
			auto Result = Executor.Execute(Command, CommandTimeout);
			return std::make_pair(std::move(Result), Clock());
		});
	}

	WCallResults Results{};
	for (size_t i = 0; i < ERemoteCall::Count; ++i)
	{
		auto [Result, FinishedAt] = Pending[i].get();
		Results[i] = std::move(Result);
		if (i == ERemoteCall::Metrics)
		{
			MetricsTime = FinishedAt;
		}
	}
	return Results;
}

bool WPoller::CollectMetrics(WCommandResult const& Result, WSeconds Now, WSnapshot& Snapshot)
{
	if (!Result.Ok())
	{
		Snapshot.Error = DescribeFailure(ERemoteCall::Metrics, Result);
		return false;
	}

	auto const Sections = SegmentParser.Parse(Result.Output);
	if (!Sections.HasSection(ESection::System))
	{
		spdlog::warn("Metrics output has no system section");
		Snapshot.DegradedSections.emplace_back(ESection::ToString(ESection::System));
	}
	Snapshot.Readings = WMetricsParser::ParseSystem(Sections.Get(ESection::System));

	auto const Counters = WMetricsParser::ParseCounters(Sections.Get(ESection::Counters));
	if (!Counters)
	{
		spdlog::warn("No WAN counters in the metrics output, reporting zero throughput");
		Snapshot.DegradedSections.emplace_back(ESection::ToString(ESection::Counters));
		return true;
	}

	Snapshot.Rates = RateTracker.Update(Counters->RxBytes, Counters->TxBytes, Now);
	return true;
}

void WPoller::CollectDevices(WCallResults const& Results, WSnapshot& Snapshot) const
{
	struct WDeviceCall
	{
		ERemoteCall::Type Call;
		ESection::Type    Section;
	};
	static constexpr WDeviceCall DeviceCalls[] = {
		{ ERemoteCall::Addresses, ESection::Addresses },
		{ ERemoteCall::Wireless, ESection::Wireless },
		{ ERemoteCall::Leases, ESection::Leases },
	};

	// Each call only contributes the section it is responsible for
	WSectionMap Sections{};
	for (auto const& [Call, Section] : DeviceCalls)
	{
		auto const& Result = Results[Call];
		if (!Result.Ok())
		{
			spdlog::warn("{}", DescribeFailure(Call, Result));
			Snapshot.DegradedSections.emplace_back(ERemoteCall::ToString(Call));
			continue;
		}

		auto const Parsed = SegmentParser.Parse(Result.Output);
		if (!Parsed.HasSection(Section))
		{
			spdlog::warn("{} call succeeded but printed no {} section", ERemoteCall::ToString(Call),
				ESection::ToString(Section));
			Snapshot.DegradedSections.emplace_back(ERemoteCall::ToString(Call));
			continue;
		}
		Sections.Merge(Parsed, Section);
	}

	Snapshot.Devices = Reconciler.Build(Sections);
}

void WPoller::CollectFlows(WCommandResult const& Result, WSnapshot& Snapshot) const
{
	if (!Result.Ok())
	{
		spdlog::warn("{}", DescribeFailure(ERemoteCall::Flows, Result));
		Snapshot.DegradedSections.emplace_back(ERemoteCall::ToString(ERemoteCall::Flows));
		return;
	}
	Snapshot.Flows = FlowParser.Parse(Result.Output, MaxFlows);
}

WSnapshot WPoller::Poll()
{
	spdlog::debug("Querying {}", Executor.Describe());

	WSeconds   Now{};
	auto const Results = RunCalls(Now);

	WSnapshot Snapshot{};
	Snapshot.Time = WTime::NowClock();

	if (CollectMetrics(Results[ERemoteCall::Metrics], Now, Snapshot))
	{
		Snapshot.Status = EPollStatus::Online;
		CollectDevices(Results, Snapshot);
		CollectFlows(Results[ERemoteCall::Flows], Snapshot);
		spdlog::debug("Poll done: {} devices, {} flows, {:.2f} Mbps down, {:.2f} Mbps up", Snapshot.Devices.size(),
			Snapshot.Flows.size(), Snapshot.Rates.DownloadMbps, Snapshot.Rates.UploadMbps);
	}
	else
	{
		Snapshot.Status = EPollStatus::Offline;
		spdlog::error("{} is unavailable: {}", Executor.Describe(), Snapshot.Error);
	}

	if (DebugHistory)
	{
		Snapshot.DebugLogs = DebugHistory->GetEntries();
	}
	return Snapshot;
}
