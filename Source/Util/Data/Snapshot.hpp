/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <spdlog/fmt/fmt.h>

#include "DeviceItem.hpp"
#include "FlowItem.hpp"
#include "RateItem.hpp"

namespace EPollStatus
{
	enum Type : uint8_t
	{
		Online,
		Offline // core metrics call failed, nothing else is meaningful
	};

	inline char const* ToString(Type Status) { return Status == Online ? "Online" : "Offline"; }
} // namespace EPollStatus

// Single value readings passed through from the gateway without reconciliation
struct WSystemReadings
{
	std::string           Load{ "0" };
	std::string           Ping{ "0" };
	std::optional<double> Temperature{};
	std::string           MemoryPercent{ "0" };

	[[nodiscard]] std::string TemperatureString() const
	{
		return Temperature ? fmt::format("{:.1f}", *Temperature) : std::string("--");
	}
};

struct WSnapshot
{
	EPollStatus::Type Status{ EPollStatus::Offline };
	std::string       Error{};
	std::string       Time{};

	WSystemReadings          Readings{};
	WRateItem                Rates{};
	std::vector<WDeviceItem> Devices{};
	std::vector<WFlowItem>   Flows{};

	// Sections whose collaborator call failed or whose marker never appeared
	std::vector<std::string> DegradedSections{};
	std::vector<std::string> DebugLogs{};

	[[nodiscard]] bool IsAvailable() const { return Status == EPollStatus::Online; }

	template <class Archive>
	void save(Archive& archive) const
	{
		archive(cereal::make_nvp("status", std::string(EPollStatus::ToString(Status))));
		if (!IsAvailable())
		{
			archive(cereal::make_nvp("error", Error), cereal::make_nvp("debug_logs", DebugLogs));
			return;
		}

		archive(cereal::make_nvp("load", Readings.Load), cereal::make_nvp("ping", Readings.Ping),
			cereal::make_nvp("temp", Readings.TemperatureString()), cereal::make_nvp("memory", Readings.MemoryPercent),
			cereal::make_nvp("download_mbps", Rates.DownloadMbps), cereal::make_nvp("upload_mbps", Rates.UploadMbps),
			cereal::make_nvp("total_mbps", Rates.TotalMbps), cereal::make_nvp("iftop", Flows),
			cereal::make_nvp("devices", Devices), cereal::make_nvp("degraded", DegradedSections),
			cereal::make_nvp("time", Time), cereal::make_nvp("debug_logs", DebugLogs));
	}
};
