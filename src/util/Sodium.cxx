// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Sodium.hxx"

#include <sodium/core.h>

#include <stdexcept>

namespace Avain {

void
EnsureSodium()
{
	static const bool initialized = sodium_init() >= 0;
	if (!initialized)
		throw std::runtime_error{"sodium_init() failed"};
}

} // namespace Avain
