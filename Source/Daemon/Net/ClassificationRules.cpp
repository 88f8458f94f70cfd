/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ClassificationRules.hpp"

#include <sstream>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "StringUtil.hpp"

WClassificationRules const& WClassificationRules::BuiltIn()
{
	// Downstream displays depend on this precedence, overlapping entries stay as they are
	static WClassificationRules const Rules{
		.PrefixRules = {
			{ "142.250.", "google" },
			{ "142.250.10.", "youtube" },
			{ "172.217.", "google" },
			{ "216.58.", "google" },
			{ "209.85.", "google" },
			{ "8.8.", "google-dns" },
			{ "157.240.", "meta" },
			{ "31.13.", "meta" },
			{ "69.171.", "meta" },
			{ "45.57.", "netflix" },
			{ "198.38.", "netflix" },
			{ "162.159.13", "discord" },
			{ "162.159.", "cloudflare" },
			{ "104.16.", "cloudflare" },
			{ "104.17.", "cloudflare" },
			{ "1.1.1.", "cloudflare-dns" },
			{ "140.82.", "github" },
			{ "151.101.", "fastly" },
			{ "13.107.", "microsoft" },
			{ "20.", "microsoft" },
			{ "40.", "microsoft" },
			{ "17.", "apple" },
			{ "52.", "amazon" },
			{ "54.", "amazon" },
			{ "54.230.", "cloudfront" },
			{ "3.", "amazon" },
			{ "23.", "akamai" },
		},
		.PortRules = {
			{ 443, "HTTPS" },
			{ 80, "HTTP" },
			{ 53, "DNS" },
			{ 853, "DNS-TLS" },
			{ 22, "SSH" },
			{ 123, "NTP" },
			{ 25, "SMTP" },
			{ 465, "SMTPS" },
			{ 587, "SUBMISSION" },
			{ 143, "IMAP" },
			{ 993, "IMAPS" },
			{ 110, "POP3" },
			{ 995, "POP3S" },
			{ 8080, "HTTP-ALT" },
			{ 8443, "HTTPS-ALT" },
			{ 1194, "OPENVPN" },
			{ 3478, "STUN" },
			{ 5223, "APNS" },
			{ 5228, "GCM" },
			{ 5353, "MDNS" },
			{ 1900, "SSDP" },
			{ 3389, "RDP" },
		},
	};
	return Rules;
}

WClassificationRules WClassificationRules::ParseRules(std::string const& Text)
{
	WClassificationRules Rules{};
	std::istringstream   Iss(Text);
	std::string          Line;
	size_t               LineNo = 0;

	while (std::getline(Iss, Line))
	{
		++LineNo;
		auto const Trimmed = WStringUtil::Trim(Line);
		if (Trimmed.empty() || Trimmed.front() == '#')
		{
			continue;
		}

		std::istringstream Fields(Trimmed);
		std::string        Kind, Key, Value;
		if (!std::getline(Fields, Kind, '\t') || !std::getline(Fields, Key, '\t') || !std::getline(Fields, Value))
		{
			spdlog::warn("Rules line {} is malformed, skipping", LineNo);
			continue;
		}
		Key = WStringUtil::Trim(Key);
		Value = WStringUtil::Trim(Value);
		if (Key.empty() || Value.empty())
		{
			spdlog::warn("Rules line {} has an empty field, skipping", LineNo);
			continue;
		}

		if (Kind == "prefix")
		{
			Rules.PrefixRules.push_back({ Key, Value });
		}
		else if (Kind == "port")
		{
			auto Port = WStringUtil::ParseUnsigned<WPort>(Key);
			if (!Port)
			{
				spdlog::warn("Rules line {}: invalid port '{}'", LineNo, Key);
				continue;
			}
			Rules.PortRules.push_back({ *Port, Value });
		}
		else
		{
			spdlog::warn("Rules line {}: unknown rule kind '{}'", LineNo, Kind);
		}
	}
	return Rules;
}

std::optional<WClassificationRules> WClassificationRules::LoadFromFile(std::string const& Path)
{
	auto Text = WFilesystem::ReadFile(Path);
	if (!Text)
	{
		spdlog::error("Can't read classification rules '{}': {}", Path, WErrnoUtil::StrError());
		return std::nullopt;
	}

	auto Rules = ParseRules(*Text);
	if (Rules.Empty())
	{
		spdlog::warn("Classification rules '{}' contain no usable rules", Path);
		return std::nullopt;
	}

	spdlog::info("Loaded {} prefix and {} port rules from '{}'", Rules.PrefixRules.size(), Rules.PortRules.size(), Path);
	return Rules;
}
