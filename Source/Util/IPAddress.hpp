/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "StringUtil.hpp"
#include "Types.hpp"

// Gateway telemetry carries addresses as text, they are kept as text and only
// interpreted where ordering or port splitting requires it
struct WIPAddress
{
	// Four dot separated integers, no range check on the octets so that
	// ordering stays total for anything that looks dotted
	using WDottedQuad = std::array<uint32_t, 4>;

	static std::optional<WDottedQuad> ParseDottedQuad(std::string_view Address)
	{
		WDottedQuad Quad{};
		size_t      Start = 0;
		for (size_t i = 0; i < Quad.size(); ++i)
		{
			size_t const Dot = Address.find('.', Start);
			bool const   bLast = i + 1 == Quad.size();
			if (bLast != (Dot == std::string_view::npos))
			{
				return std::nullopt;
			}

			auto Part = Address.substr(Start, bLast ? std::string_view::npos : Dot - Start);
			auto Value = WStringUtil::ParseUnsigned<uint32_t>(Part);
			if (!Value)
			{
				return std::nullopt;
			}
			Quad[i] = *Value;
			Start = Dot + 1;
		}
		return Quad;
	}

	static bool LooksLikeIPv4(std::string_view Address)
	{
		auto Quad = ParseDottedQuad(Address);
		if (!Quad)
		{
			return false;
		}
		for (auto Octet : *Quad)
		{
			if (Octet > 255)
			{
				return false;
			}
		}
		return true;
	}

	// Loose check, enough to tell an address from a rate figure like "1.2Kb"
	static bool LooksLikeIPv6(std::string_view Address)
	{
		if (std::count(Address.begin(), Address.end(), ':') < 2)
		{
			return false;
		}
		return std::ranges::all_of(Address, [](unsigned char C) { return std::isxdigit(C) != 0 || C == ':' || C == '.'; });
	}

	// Last dotted component, "10.0.0.42" -> "42"
	static std::string LastOctet(std::string const& Address)
	{
		auto const Dot = Address.rfind('.');
		if (Dot == std::string::npos)
		{
			return Address;
		}
		return Address.substr(Dot + 1);
	}
};

struct WEndpoint
{
	std::string          Address{};
	std::optional<WPort> Port{};

	[[nodiscard]] std::string ToString() const
	{
		if (!Port)
		{
			return Address;
		}
		if (Address.find(':') != std::string::npos)
		{
			return "[" + Address + "]:" + std::to_string(*Port);
		}
		return Address + ":" + std::to_string(*Port);
	}

	// "addr:port", "[v6]:port" or a bare address. A token with several colons and
	// no brackets is a bare IPv6 address
	static WEndpoint FromToken(std::string_view Token)
	{
		WEndpoint Endpoint{};
		if (!Token.empty() && Token.front() == '[')
		{
			auto const Close = Token.find(']');
			if (Close != std::string_view::npos)
			{
				Endpoint.Address = std::string(Token.substr(1, Close - 1));
				if (Close + 1 < Token.size() && Token[Close + 1] == ':')
				{
					Endpoint.Port = WStringUtil::ParseUnsigned<WPort>(Token.substr(Close + 2));
				}
				return Endpoint;
			}
		}

		auto const Colon = Token.rfind(':');
		if (Colon == std::string_view::npos || Token.find(':') != Colon)
		{
			Endpoint.Address = std::string(Token);
			return Endpoint;
		}

		Endpoint.Address = std::string(Token.substr(0, Colon));
		Endpoint.Port = WStringUtil::ParseUnsigned<WPort>(Token.substr(Colon + 1));
		return Endpoint;
	}
};

inline bool operator==(WEndpoint const& Lhs, WEndpoint const& Rhs)
{
	return Lhs.Address == Rhs.Address && Lhs.Port == Rhs.Port;
}
