/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProcessExecutor.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "ErrnoUtil.hpp"

namespace
{
	using WClock = std::chrono::steady_clock;

	int RemainingMs(WClock::time_point Deadline)
	{
		auto const Left = std::chrono::duration_cast<std::chrono::milliseconds>(Deadline - WClock::now()).count();
		return Left > 0 ? static_cast<int>(Left) : 0;
	}

	// Kills the whole process group, the shell may have forked helpers of its own
	void KillAndReap(pid_t Pid)
	{
		if (kill(-Pid, SIGKILL) < 0 && kill(Pid, SIGKILL) < 0 && errno != ESRCH)
		{
			spdlog::warn("Failed to kill command process {}: {}", Pid, WErrnoUtil::StrError());
		}
		int Status = 0;
		while (waitpid(Pid, &Status, 0) < 0 && errno == EINTR)
		{
		}
	}

	enum class EReadOutcome
	{
		Eof,
		Timeout,
		Error
	};

	EReadOutcome ReadUntilEof(int Fd, std::string& Output, WClock::time_point Deadline)
	{
		char Buffer[4096];
		for (;;)
		{
			int const Wait = RemainingMs(Deadline);
			if (Wait <= 0)
			{
				return EReadOutcome::Timeout;
			}

			pollfd Pfd{ Fd, POLLIN, 0 };
			int const Ready = poll(&Pfd, 1, Wait);
			if (Ready < 0)
			{
				if (errno == EINTR)
				{
					continue;
				}
				spdlog::error("poll() on command output failed: {}", WErrnoUtil::StrError());
				return EReadOutcome::Error;
			}
			if (Ready == 0)
			{
				continue;
			}

			ssize_t const Count = read(Fd, Buffer, sizeof(Buffer));
			if (Count < 0)
			{
				if (errno == EINTR || errno == EAGAIN)
				{
					continue;
				}
				spdlog::error("read() on command output failed: {}", WErrnoUtil::StrError());
				return EReadOutcome::Error;
			}
			if (Count == 0)
			{
				return EReadOutcome::Eof;
			}
			Output.append(Buffer, static_cast<size_t>(Count));
		}
	}

	// The child closed stdout, give it until the deadline to actually exit
	bool WaitForExit(pid_t Pid, int& Status, WClock::time_point Deadline)
	{
		for (;;)
		{
			pid_t const Result = waitpid(Pid, &Status, WNOHANG);
			if (Result == Pid)
			{
				return true;
			}
			if (Result < 0 && errno != EINTR)
			{
				spdlog::error("waitpid({}) failed: {}", Pid, WErrnoUtil::StrError());
				return false;
			}
			if (RemainingMs(Deadline) <= 0)
			{
				return false;
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(5));
		}
	}
} // namespace

ECommandError::Type WProcessExecutor::ClassifyExitCode(int ExitCode) const
{
	return ExitCode == ExecFailedStatus ? ECommandError::TransportError : ECommandError::NonZeroExit;
}

WCommandResult WProcessExecutor::Execute(std::string const& Command, WTimeout Timeout)
{
	// Everything the child needs is prepared before fork(), other poll threads may be running
	auto const Args = BuildArgv(Command);
	if (Args.empty())
	{
		return WCommandResult::Failure(ECommandError::TransportError, "empty command line");
	}
	std::vector<char*> Argv{};
	Argv.reserve(Args.size() + 1);
	for (auto const& Arg : Args)
	{
		Argv.push_back(const_cast<char*>(Arg.c_str()));
	}
	Argv.push_back(nullptr);

	int Pipe[2];
	if (pipe2(Pipe, O_CLOEXEC) < 0)
	{
		return WCommandResult::Failure(ECommandError::TransportError, "pipe2() failed: " + WErrnoUtil::StrError());
	}

	int const DevNull = open("/dev/null", O_RDWR | O_CLOEXEC);
	if (DevNull < 0)
	{
		auto Message = "Failed to open /dev/null: " + WErrnoUtil::StrError();
		close(Pipe[0]);
		close(Pipe[1]);
		return WCommandResult::Failure(ECommandError::TransportError, std::move(Message));
	}

	auto const  Deadline = WClock::now() + Timeout;
	pid_t const Pid = fork();
	if (Pid < 0)
	{
		auto Message = "fork() failed: " + WErrnoUtil::StrError();
		close(Pipe[0]);
		close(Pipe[1]);
		close(DevNull);
		return WCommandResult::Failure(ECommandError::TransportError, std::move(Message));
	}

	if (Pid == 0)
	{
		// Child, only async-signal-safe calls from here on
		setpgid(0, 0);
		dup2(DevNull, STDIN_FILENO);
		dup2(Pipe[1], STDOUT_FILENO);
		dup2(DevNull, STDERR_FILENO);
		signal(SIGPIPE, SIG_DFL);
		execvp(Argv[0], Argv.data());
		_exit(ExecFailedStatus);
	}

	// Also done by the parent so the group exists before a kill can be sent to it
	setpgid(Pid, Pid);
	close(Pipe[1]);
	close(DevNull);

	WCommandResult Result{};
	auto const     Outcome = ReadUntilEof(Pipe[0], Result.Output, Deadline);
	close(Pipe[0]);

	if (Outcome != EReadOutcome::Eof)
	{
		KillAndReap(Pid);
		if (Outcome == EReadOutcome::Timeout)
		{
			spdlog::debug("'{}' on {} timed out after {}ms", Args[0], Describe(), Timeout.count());
			return WCommandResult::Failure(ECommandError::Timeout, fmt::format("timed out after {}ms", Timeout.count()));
		}
		return WCommandResult::Failure(ECommandError::TransportError, "failed to read command output");
	}

	int Status = 0;
	if (!WaitForExit(Pid, Status, Deadline))
	{
		KillAndReap(Pid);
		return WCommandResult::Failure(ECommandError::Timeout, fmt::format("timed out after {}ms", Timeout.count()));
	}

	if (WIFSIGNALED(Status))
	{
		return WCommandResult::Failure(
			ECommandError::TransportError, fmt::format("killed by signal {}", WTERMSIG(Status)));
	}

	Result.ExitCode = WIFEXITED(Status) ? WEXITSTATUS(Status) : -1;
	if (Result.ExitCode != 0)
	{
		Result.Error = ClassifyExitCode(Result.ExitCode);
		Result.Message = fmt::format("exited with status {}", Result.ExitCode);
		Result.Output.clear();
	}
	return Result;
}

std::vector<std::string> WLocalExecutor::BuildArgv(std::string const& Command) const
{
	return { "/bin/sh", "-c", Command };
}

std::vector<std::string> WSshExecutor::BuildArgv(std::string const& Command) const
{
	std::vector<std::string> Argv{
		"ssh",
		"-o",
		fmt::format("ConnectTimeout={}", Target.ConnectTimeoutSeconds),
		"-o",
		"BatchMode=yes",
		"-p",
		std::to_string(Target.Port),
	};
	if (!Target.IdentityFile.empty())
	{
		Argv.emplace_back("-i");
		Argv.push_back(Target.IdentityFile);
	}
	Argv.push_back(Target.User.empty() ? Target.Host : Target.User + "@" + Target.Host);
	Argv.push_back(Command);
	return Argv;
}

ECommandError::Type WSshExecutor::ClassifyExitCode(int ExitCode) const
{
	if (ExitCode == SshTransportStatus)
	{
		return ECommandError::TransportError;
	}
	return WProcessExecutor::ClassifyExitCode(ExitCode);
}
