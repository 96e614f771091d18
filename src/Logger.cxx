// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "Error.hxx"

#include <atomic>

#include <stdio.h>

namespace Avain {

static std::atomic_uint log_level{1};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

unsigned
GetLogLevel() noexcept
{
	return log_level.load(std::memory_order_relaxed);
}

bool
Logger::CheckLevel(unsigned level) noexcept
{
	return level <= GetLogLevel();
}

void
Logger::operator()(unsigned level, std::exception_ptr ep) const
{
	if (CheckLevel(level))
		Log(GetFullMessage(ep));
}

void
Logger::Log(std::string_view msg) const
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", msg);
	else
		fmt::print(stderr, "{}: {}\n", domain, msg);
}

} // namespace Avain
