// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>
#include <utility> // for std::forward()

namespace Avain {

/**
 * A logger which writes to stderr, prefixing each line with its
 * domain.  Level 1 is for errors, 2 for informational messages and
 * everything above for debug output.  Messages above the global
 * level (see SetLogLevel()) are discarded.
 */
class Logger {
	std::string domain;

public:
	explicit Logger(std::string_view _domain={}) noexcept
		:domain(_domain) {}

	[[gnu::pure]]
	static bool CheckLevel(unsigned level) noexcept;

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const {
		if (CheckLevel(level))
			Log(fmt::format(format_str, std::forward<Args>(args)...));
	}

	void operator()(unsigned level, std::string_view msg) const {
		if (CheckLevel(level))
			Log(msg);
	}

	/**
	 * Log the message of the given exception and all exceptions
	 * nested inside it.
	 */
	void operator()(unsigned level, std::exception_ptr ep) const;

private:
	void Log(std::string_view msg) const;
};

void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

} // namespace Avain
