/*
 * Copyright (c) 2025-2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DebugHistory.hpp"

#include <algorithm>
#include <spdlog/pattern_formatter.h>
#include <spdlog/spdlog.h>

WDebugHistorySink::WDebugHistorySink(WDebugHistory* InOwner)
	: Owner(InOwner)
	, Formatter(std::make_unique<spdlog::pattern_formatter>(
		  WDebugHistory::Pattern, spdlog::pattern_time_type::local, std::string{}))
{
}

void WDebugHistorySink::Disown()
{
	std::lock_guard Lock(mutex_);
	Owner = nullptr;
}

void WDebugHistorySink::sink_it_(spdlog::details::log_msg const& Message)
{
	if (!Owner)
	{
		return;
	}
	spdlog::memory_buf_t Formatted;
	Formatter->format(Message, Formatted);
	Owner->Append(std::string(Formatted.data(), Formatted.size()));
}

WDebugHistory::WDebugHistory(size_t MaxEntries_) : MaxEntries(std::max<size_t>(MaxEntries_, 1)) {}

WDebugHistory::~WDebugHistory()
{
	Detach();
}

void WDebugHistory::AttachTo(std::shared_ptr<spdlog::logger> Logger)
{
	if (Sink)
	{
		return;
	}
	AttachedLogger = Logger ? std::move(Logger) : spdlog::default_logger();
	Sink = std::make_shared<WDebugHistorySink>(this);
	AttachedLogger->sinks().push_back(Sink);
}

void WDebugHistory::Detach()
{
	if (!Sink)
	{
		return;
	}
	auto& Sinks = AttachedLogger->sinks();
	Sinks.erase(std::remove(Sinks.begin(), Sinks.end(), Sink), Sinks.end());
	// The logger may still be in the middle of a call into the sink
	Sink->Disown();
	Sink.reset();
	AttachedLogger.reset();
}

void WDebugHistory::Append(std::string Entry)
{
	std::lock_guard Lock(Mutex);
	Entries.push_back(std::move(Entry));
	while (Entries.size() > MaxEntries)
	{
		Entries.pop_front();
	}
}

void WDebugHistory::Clear()
{
	std::lock_guard Lock(Mutex);
	Entries.clear();
}

std::vector<std::string> WDebugHistory::GetEntries() const
{
	std::lock_guard Lock(Mutex);
	return { Entries.begin(), Entries.end() };
}
