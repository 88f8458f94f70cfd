/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include "ErrnoUtil.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <optional>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace stdfs = std::filesystem;

class WFilesystem
{
public:
	static bool Exists(stdfs::path const& p)
	{
		std::error_code Ec;
		return stdfs::exists(p, Ec);
	}

	static std::optional<std::string> ReadFile(stdfs::path const& Path)
	{
		std::ifstream FileStream(Path, std::ios::in | std::ios::binary);
		if (!FileStream)
			return std::nullopt;

		std::ostringstream ss;
		ss << FileStream.rdbuf();
		return ss.str();
	}

	// Readers polling the file never observe a half written document
	static bool WriteFileAtomically(stdfs::path const& Path, std::string const& Content)
	{
		stdfs::path TempPath = Path;
		TempPath += ".tmp." + std::to_string(getpid());

		bool bWritten = false;
		{
			std::ofstream Out(TempPath, std::ios::out | std::ios::binary | std::ios::trunc);
			if (!Out.is_open())
			{
				spdlog::error("Failed to open '{}' for writing: {}", TempPath.string(), WErrnoUtil::StrError());
				return false;
			}
			Out << Content;
			// Buffered data only hits the disk here
			Out.close();
			bWritten = !Out.fail();
		}

		if (!bWritten)
		{
			spdlog::error("Failed to write '{}': {}", TempPath.string(), WErrnoUtil::StrError());
			std::error_code Ec;
			stdfs::remove(TempPath, Ec);
			return false;
		}

		if (std::rename(TempPath.c_str(), Path.c_str()) != 0)
		{
			spdlog::error("rename({} -> {}) failed: {}", TempPath.string(), Path.string(), WErrnoUtil::StrError());
			std::error_code Ec;
			stdfs::remove(TempPath, Ec);
			return false;
		}
		return true;
	}
};
