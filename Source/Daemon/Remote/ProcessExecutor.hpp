/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <vector>

#include "IRemoteExecutor.hpp"

/**
 * Forks a child with stdout on a pipe and reads it until EOF or the deadline.
 * On timeout the child gets SIGKILL and is reaped before returning, so no
 * zombie outlives a poll. stderr goes to /dev/null.
 */
class WProcessExecutor : public IRemoteExecutor
{
protected:
	// Exit status the child reports when exec() itself failed
	static constexpr int ExecFailedStatus = 127;

	[[nodiscard]] virtual std::vector<std::string> BuildArgv(std::string const& Command) const = 0;

	// Maps a non-zero exit status, subclasses know which codes mean "unreachable"
	[[nodiscard]] virtual ECommandError::Type ClassifyExitCode(int ExitCode) const;

public:
	WCommandResult Execute(std::string const& Command, WTimeout Timeout) override;
};

// Runs the command directly on this machine, for when the daemon lives on the gateway
class WLocalExecutor final : public WProcessExecutor
{
protected:
	[[nodiscard]] std::vector<std::string> BuildArgv(std::string const& Command) const override;

public:
	[[nodiscard]] std::string Describe() const override { return "local shell"; }
};

struct WSshTarget
{
	std::string Host{};
	std::string User{ "root" };
	uint16_t    Port{ 22 };
	std::string IdentityFile{};
	int         ConnectTimeoutSeconds{ 3 };
};

// ssh in batch mode, authentication has to be set up with keys beforehand
class WSshExecutor final : public WProcessExecutor
{
	WSshTarget Target;

	// ssh exits with 255 when the connection itself failed
	static constexpr int SshTransportStatus = 255;

protected:
	[[nodiscard]] std::vector<std::string> BuildArgv(std::string const& Command) const override;
	[[nodiscard]] ECommandError::Type      ClassifyExitCode(int ExitCode) const override;

public:
	explicit WSshExecutor(WSshTarget Target_) : Target(std::move(Target_)) {}

	[[nodiscard]] std::string Describe() const override { return Target.User + "@" + Target.Host; }

	// Exposed for tests
	[[nodiscard]] std::vector<std::string> GetArgv(std::string const& Command) const { return BuildArgv(Command); }
};
