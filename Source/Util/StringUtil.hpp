/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

class WStringUtil
{
public:
	static std::vector<std::string> SplitWhitespace(std::string_view Line)
	{
		std::vector<std::string> Parts{};
		std::istringstream       Iss{ std::string(Line) };
		std::string              Part;
		while (Iss >> Part)
		{
			Parts.push_back(std::move(Part));
		}
		return Parts;
	}

	static std::vector<std::string> SplitLines(std::string_view Text)
	{
		std::vector<std::string> Lines{};
		std::istringstream       Iss{ std::string(Text) };
		std::string              Line;
		while (std::getline(Iss, Line))
		{
			if (!Line.empty() && Line.back() == '\r')
			{
				Line.pop_back();
			}
			Lines.push_back(std::move(Line));
		}
		return Lines;
	}

	static std::string Trim(std::string_view S)
	{
		auto const IsSpace = [](unsigned char C) { return std::isspace(C) != 0; };
		auto       Begin = std::find_if_not(S.begin(), S.end(), IsSpace);
		auto       End = std::find_if_not(S.rbegin(), S.rend(), IsSpace).base();
		if (Begin >= End)
		{
			return {};
		}
		return { Begin, End };
	}

	static std::string ToLower(std::string S)
	{
		std::ranges::transform(S, S.begin(), [](unsigned char C) { return static_cast<char>(std::tolower(C)); });
		return S;
	}

	static std::string ToUpper(std::string S)
	{
		std::ranges::transform(S, S.begin(), [](unsigned char C) { return static_cast<char>(std::toupper(C)); });
		return S;
	}

	// Strict unsigned parse, the whole string must be digits
	template <typename T>
	static std::optional<T> ParseUnsigned(std::string_view S)
	{
		if (S.empty())
		{
			return std::nullopt;
		}
		T    Value{};
		auto Result = std::from_chars(S.data(), S.data() + S.size(), Value);
		if (Result.ec != std::errc() || Result.ptr != S.data() + S.size())
		{
			return std::nullopt;
		}
		return Value;
	}

	static bool IsDigits(std::string_view S)
	{
		return !S.empty() && std::ranges::all_of(S, [](unsigned char C) { return std::isdigit(C) != 0; });
	}
};
