/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"

struct WPrefixRule
{
	std::string Prefix{};  // literal leading substring of the dotted address
	std::string Service{}; // e.g. "google"
};

struct WPortRule
{
	WPort       Port{};
	std::string Protocol{}; // e.g. "HTTPS"
};

// Ordered match tables, declaration order is the match order. Prefixes may
// overlap: "142.250." comes before "142.250.10." so the latter never matches
struct WClassificationRules
{
	std::vector<WPrefixRule> PrefixRules{};
	std::vector<WPortRule>   PortRules{};

	[[nodiscard]] bool Empty() const { return PrefixRules.empty() && PortRules.empty(); }

	static WClassificationRules const& BuiltIn();

	// Tab separated, one rule per line:
	//   prefix<TAB>142.250.<TAB>google
	//   port<TAB>443<TAB>HTTPS
	// '#' starts a comment, malformed lines are skipped
	static std::optional<WClassificationRules> LoadFromFile(std::string const& Path);

	static WClassificationRules ParseRules(std::string const& Text);
};
