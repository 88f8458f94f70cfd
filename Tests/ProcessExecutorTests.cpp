/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <catch2/catch.hpp>
#include <chrono>
#include <future>

#include "Remote/ProcessExecutor.hpp"

using namespace std::chrono_literals;

TEST_CASE("Local commands return their stdout", "[executor]")
{
	WLocalExecutor Executor{};

	auto const Result = Executor.Execute("echo hello; echo ignored >&2", 5s);
	REQUIRE(Result.Ok());
	REQUIRE(Result.ExitCode == 0);
	REQUIRE(Result.Output == "hello\n");
}

TEST_CASE("Large outputs are read completely", "[executor]")
{
	WLocalExecutor Executor{};

	// More than a pipe buffer
	auto const Result = Executor.Execute("i=0; while [ $i -lt 20000 ]; do echo line$i; i=$((i+1)); done", 20s);
	REQUIRE(Result.Ok());
	REQUIRE(Result.Output.size() > 65536);
	REQUIRE(Result.Output.rfind("line19999\n") == Result.Output.size() - 10);
}

TEST_CASE("Exit codes are mapped to command errors", "[executor]")
{
	WLocalExecutor Executor{};

	SECTION("non-zero exit")
	{
		auto const Result = Executor.Execute("echo partial; exit 3", 5s);
		REQUIRE(Result.Error == ECommandError::NonZeroExit);
		REQUIRE(Result.ExitCode == 3);
		REQUIRE(Result.Output.empty());
		REQUIRE_FALSE(Result.Message.empty());
	}

	SECTION("command not found")
	{
		auto const Result = Executor.Execute("wachposten-command-that-does-not-exist", 5s);
		REQUIRE(Result.Error == ECommandError::TransportError);
		REQUIRE(Result.ExitCode == 127);
	}
}

TEST_CASE("Commands exceeding the timeout are killed", "[executor]")
{
	WLocalExecutor Executor{};

	auto const Start = std::chrono::steady_clock::now();
	auto const Result = Executor.Execute("echo started; sleep 10", 300ms);
	auto const Elapsed = std::chrono::steady_clock::now() - Start;

	REQUIRE(Result.Error == ECommandError::Timeout);
	REQUIRE(Result.Output.empty());
	REQUIRE(Elapsed < 5s);
}

TEST_CASE("Concurrent commands do not share output", "[executor]")
{
	WLocalExecutor Executor{};

	auto First = std::async(std::launch::async, [&] { return Executor.Execute("sleep 0.2; echo first", 5s); });
	auto Second = std::async(std::launch::async, [&] { return Executor.Execute("echo second", 5s); });

	REQUIRE(First.get().Output == "first\n");
	REQUIRE(Second.get().Output == "second\n");
}

TEST_CASE("ssh is invoked in batch mode", "[executor]")
{
	WSshTarget Target{};
	Target.Host = "10.0.0.1";

	SECTION("defaults")
	{
		WSshExecutor const Executor(Target);
		REQUIRE(Executor.Describe() == "root@10.0.0.1");
		REQUIRE(Executor.GetArgv("uptime") ==
			std::vector<std::string>{
				"ssh", "-o", "ConnectTimeout=3", "-o", "BatchMode=yes", "-p", "22", "root@10.0.0.1", "uptime" });
	}

	SECTION("identity file and port")
	{
		Target.Port = 2222;
		Target.IdentityFile = "/etc/wachposten/id_ed25519";
		Target.ConnectTimeoutSeconds = 5;
		WSshExecutor const Executor(Target);
		REQUIRE(Executor.GetArgv("uptime") ==
			std::vector<std::string>{ "ssh", "-o", "ConnectTimeout=5", "-o", "BatchMode=yes", "-p", "2222", "-i",
				"/etc/wachposten/id_ed25519", "root@10.0.0.1", "uptime" });
	}
}
