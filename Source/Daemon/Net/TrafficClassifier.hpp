/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <unordered_map>

#include "ClassificationRules.hpp"
#include "Data/FlowItem.hpp"

class WTrafficClassifier
{
	std::vector<WPrefixRule>               PrefixRules;
	std::unordered_map<WPort, std::string> PortProtocolMap;

public:
	static constexpr char const* OtherTag = "other";

	explicit WTrafficClassifier(WClassificationRules const& Rules = WClassificationRules::BuiltIn());

	// First prefix that the address starts with, then the port table, then "PORT <n>"
	[[nodiscard]] WClassification Classify(std::string const& Address, WPort Port) const;

	// "google-dns" -> "google-dns", "Cloud Front" -> "cloud-front"
	static std::string MakeTag(std::string const& Name);
};
