/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

// Process wide instance for state that is global by nature (signal flags)
template <typename T>
class TSingleton
{
public:
	static T& GetInstance()
	{
		static T Instance{};
		return Instance;
	}

	TSingleton(TSingleton const&) = delete;
	TSingleton& operator=(TSingleton const&) = delete;

protected:
	TSingleton() = default;
	virtual ~TSingleton() = default;
};
