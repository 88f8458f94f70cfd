/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <catch2/catch.hpp>
#include <spdlog/spdlog.h>

#include "DebugHistory.hpp"

namespace
{
	std::shared_ptr<spdlog::logger> MakeLogger()
	{
		auto Logger = std::make_shared<spdlog::logger>("history-test");
		Logger->set_level(spdlog::level::trace);
		return Logger;
	}
} // namespace

TEST_CASE("The history keeps the most recent entries", "[history]")
{
	auto          Logger = MakeLogger();
	WDebugHistory History(3);
	History.AttachTo(Logger);

	Logger->info("one");
	Logger->info("two");
	Logger->warn("three");
	Logger->error("four");

	auto const Entries = History.GetEntries();
	REQUIRE(Entries.size() == 3);
	REQUIRE_THAT(Entries[0], Catch::Matchers::EndsWith("[info] two"));
	REQUIRE_THAT(Entries[1], Catch::Matchers::EndsWith("[warning] three"));
	REQUIRE_THAT(Entries[2], Catch::Matchers::EndsWith("[error] four"));

	SECTION("entries carry a millisecond clock")
	{
		REQUIRE_THAT(Entries[0], Catch::Matchers::Matches(R"(\d\d:\d\d:\d\d\.\d\d\d \[info\] two)"));
	}

	SECTION("clearing")
	{
		History.Clear();
		REQUIRE(History.GetEntries().empty());
		Logger->info("five");
		REQUIRE(History.GetEntries().size() == 1);
	}

	SECTION("logger patterns do not change the entries")
	{
		Logger->set_pattern("%v");
		Logger->info("five");
		REQUIRE_THAT(History.GetEntries().back(), Catch::Matchers::EndsWith("[info] five"));
	}

	SECTION("detached histories stop recording")
	{
		History.Detach();
		Logger->info("five");
		REQUIRE(History.GetEntries().size() == 3);
		REQUIRE(Logger->sinks().empty());
	}
}

TEST_CASE("Messages below the logger level are not recorded", "[history]")
{
	auto Logger = MakeLogger();
	Logger->set_level(spdlog::level::warn);
	WDebugHistory History(10);
	History.AttachTo(Logger);

	Logger->debug("hidden");
	Logger->warn("shown");

	auto const Entries = History.GetEntries();
	REQUIRE(Entries.size() == 1);
	REQUIRE_THAT(Entries[0], Catch::Matchers::EndsWith("shown"));
}
