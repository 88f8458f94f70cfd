/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RateTracker.hpp"

#include <spdlog/spdlog.h>

#include "Format.hpp"

WRateItem WRateTracker::Update(WBytes RxBytes, WBytes TxBytes, WSeconds Now)
{
	std::lock_guard Lock(Mutex);

	WRateItem Rates{};
	if (bHasPrevious)
	{
		WSeconds const Elapsed = Now - Previous.Timestamp;
		if (Elapsed > 0)
		{
			// Counters wrap or reset when the gateway reboots, never report that as traffic
			WBytes const DeltaRx = RxBytes >= Previous.RxBytes ? RxBytes - Previous.RxBytes : 0;
			WBytes const DeltaTx = TxBytes >= Previous.TxBytes ? TxBytes - Previous.TxBytes : 0;
			if (RxBytes < Previous.RxBytes || TxBytes < Previous.TxBytes)
			{
				spdlog::info("WAN counters went backwards (rx {} -> {}, tx {} -> {}), assuming reset",
					Previous.RxBytes, RxBytes, Previous.TxBytes, TxBytes);
			}

			Rates.RawDownloadMbps = WRateFormat::BytesToMbps(DeltaRx, Elapsed);
			Rates.RawUploadMbps = WRateFormat::BytesToMbps(DeltaTx, Elapsed);
			Rates.DownloadMbps = WRateFormat::Round(Rates.RawDownloadMbps, Decimals);
			Rates.UploadMbps = WRateFormat::Round(Rates.RawUploadMbps, Decimals);
			// Rounded again only to drop floating point noise from the addition
			Rates.TotalMbps = WRateFormat::Round(Rates.DownloadMbps + Rates.UploadMbps, Decimals);
		}
		else
		{
			spdlog::debug("Clock did not advance since the last counter reading ({}s)", Elapsed);
		}
	}

	Previous = WCounterSample{ RxBytes, TxBytes, Now };
	bHasPrevious = true;
	return Rates;
}

std::optional<WCounterSample> WRateTracker::GetPrevious() const
{
	std::lock_guard Lock(Mutex);
	if (!bHasPrevious)
	{
		return std::nullopt;
	}
	return Previous;
}
