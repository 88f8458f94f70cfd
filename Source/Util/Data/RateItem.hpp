/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include "Types.hpp"

struct WCounterSample
{
	WBytes   RxBytes{};
	WBytes   TxBytes{};
	WSeconds Timestamp{};
};

struct WRateItem
{
	// Display values, rounded per field, Total is the sum of the rounded fields
	WMbps DownloadMbps{};
	WMbps UploadMbps{};
	WMbps TotalMbps{};

	// Unrounded values the display fields were derived from
	WMbps RawDownloadMbps{};
	WMbps RawUploadMbps{};
};
