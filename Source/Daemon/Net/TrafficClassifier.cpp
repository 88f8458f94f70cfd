/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "TrafficClassifier.hpp"

#include <cctype>
#include <spdlog/spdlog.h>

#include "StringUtil.hpp"

WTrafficClassifier::WTrafficClassifier(WClassificationRules const& Rules) : PrefixRules(Rules.PrefixRules)
{
	for (auto const& [Port, Protocol] : Rules.PortRules)
	{
		// emplace keeps the first declaration of a duplicated port
		if (!PortProtocolMap.emplace(Port, Protocol).second)
		{
			spdlog::debug("Port {} declared twice, keeping '{}'", Port, PortProtocolMap[Port]);
		}
	}
}

WClassification WTrafficClassifier::Classify(std::string const& Address, WPort Port) const
{
	for (auto const& [Prefix, Service] : PrefixRules)
	{
		if (Address.starts_with(Prefix))
		{
			return { WStringUtil::ToUpper(Service), MakeTag(Service) };
		}
	}

	if (auto It = PortProtocolMap.find(Port); It != PortProtocolMap.end())
	{
		return { It->second, MakeTag(It->second) };
	}

	return { "PORT " + std::to_string(Port), OtherTag };
}

std::string WTrafficClassifier::MakeTag(std::string const& Name)
{
	std::string Tag;
	Tag.reserve(Name.size());
	for (unsigned char C : Name)
	{
		if (std::isalnum(C) != 0)
		{
			Tag.push_back(static_cast<char>(std::tolower(C)));
		}
		else if (!Tag.empty() && Tag.back() != '-')
		{
			Tag.push_back('-');
		}
	}
	while (!Tag.empty() && Tag.back() == '-')
	{
		Tag.pop_back();
	}
	return Tag.empty() ? std::string(OtherTag) : Tag;
}
