/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include "StringUtil.hpp"

// MAC addresses as the gateway prints them: six colon separated hex pairs
class WHardwareAddress
{
public:
	static constexpr size_t            TextLength = 17;
	static constexpr std::string_view  Wildcard = "00:00:00:00:00:00";

	static bool IsValid(std::string_view Mac)
	{
		if (Mac.size() != TextLength)
		{
			return false;
		}
		for (size_t i = 0; i < Mac.size(); ++i)
		{
			auto const C = static_cast<unsigned char>(Mac[i]);
			if (i % 3 == 2)
			{
				if (C != ':')
				{
					return false;
				}
			}
			else if (std::isxdigit(C) == 0)
			{
				return false;
			}
		}
		return true;
	}

	// Lower-cased MAC or nullopt if the token is not a MAC
	static std::optional<std::string> Normalize(std::string_view Mac)
	{
		if (!IsValid(Mac))
		{
			return std::nullopt;
		}
		return WStringUtil::ToLower(std::string(Mac));
	}

	static bool IsWildcard(std::string_view NormalizedMac) { return NormalizedMac == Wildcard; }
};
