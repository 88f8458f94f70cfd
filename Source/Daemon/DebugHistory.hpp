/*
 * Copyright (c) 2025-2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/formatter.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/base_sink.h>

class WDebugHistory;

// Formats with its own pattern, patterns set on the logger (e.g. the systemd one) do not apply
class WDebugHistorySink : public spdlog::sinks::base_sink<std::mutex>
{
	WDebugHistory*                     Owner{};
	std::unique_ptr<spdlog::formatter> Formatter;

public:
	explicit WDebugHistorySink(WDebugHistory* InOwner);

	void Disown();

protected:
	void sink_it_(spdlog::details::log_msg const& Message) override;
	void flush_() override {}
	void set_pattern_(std::string const&) override {}
	void set_formatter_(std::unique_ptr<spdlog::formatter>) override {}
};

/**
 * Keeps the last MaxEntries log lines as "HH:MM:SS.mmm [level] message" so
 * every snapshot can carry the recent history of the daemon.
 */
class WDebugHistory
{
	mutable std::mutex                 Mutex;
	size_t                             MaxEntries;
	std::deque<std::string>            Entries{};
	std::shared_ptr<WDebugHistorySink> Sink{};
	std::shared_ptr<spdlog::logger>    AttachedLogger{};

public:
	static constexpr char const* Pattern = "%H:%M:%S.%e [%l] %v";

	explicit WDebugHistory(size_t MaxEntries_ = 50);
	~WDebugHistory();

	WDebugHistory(WDebugHistory const&) = delete;
	WDebugHistory& operator=(WDebugHistory const&) = delete;

	// Adds the history sink next to the logger's existing sinks, the default logger if null
	void AttachTo(std::shared_ptr<spdlog::logger> Logger = {});
	void Detach();

	void Append(std::string Entry);
	void Clear();

	// Oldest first
	[[nodiscard]] std::vector<std::string> GetEntries() const;
};
