/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <string>
#include <utility>

#include "Types.hpp"

namespace ECommandError
{
	enum Type : uint8_t
	{
		None = 0,
		Timeout,
		NonZeroExit,
		TransportError // could not reach the gateway or start the command at all
	};

	inline char const* ToString(Type Error)
	{
		switch (Error)
		{
			case None:
				return "none";
			case Timeout:
				return "timeout";
			case NonZeroExit:
				return "non-zero exit";
			case TransportError:
			default:
				return "transport error";
		}
	}
} // namespace ECommandError

struct WCommandResult
{
	ECommandError::Type Error{ ECommandError::None };
	std::string         Output{};
	int                 ExitCode{ 0 };
	std::string         Message{}; // human readable detail for the log

	[[nodiscard]] bool Ok() const { return Error == ECommandError::None; }

	static WCommandResult Success(std::string Output_) { return { ECommandError::None, std::move(Output_), 0, {} }; }

	static WCommandResult Failure(ECommandError::Type Error_, std::string Message_, int ExitCode_ = -1)
	{
		return { Error_, {}, ExitCode_, std::move(Message_) };
	}
};

// Runs one shell command on the gateway and returns its stdout.
// Implementations must return within roughly Timeout
class IRemoteExecutor
{
public:
	virtual ~IRemoteExecutor() = default;

	virtual WCommandResult Execute(std::string const& Command, WTimeout Timeout) = 0;

	// For log messages, e.g. "root@10.0.0.1"
	[[nodiscard]] virtual std::string Describe() const = 0;
};
