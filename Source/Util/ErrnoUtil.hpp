/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cerrno>
#include <cstring>
#include <string>

class WErrnoUtil
{
public:
	static std::string StrError() { return StrError(errno); }

	static std::string StrError(int Error) { return FormatError(Error); }

private:
	static std::string FormatError(int Error)
	{
		char Buffer[256]{};
		return FromResult(strerror_r(Error, Buffer, sizeof(Buffer)), Buffer) + " (" + std::to_string(Error) + ")";
	}

	// GNU strerror_r returns the message, XSI strerror_r fills the buffer
	static std::string FromResult(char const* Message, char const*) { return Message; }

	static std::string FromResult(int Result, char const* Buffer)
	{
		return Result == 0 ? std::string(Buffer) : std::string("Unknown error");
	}
};
