// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"

#include <cstddef>
#include <span>

namespace Avain {

/**
 * Parse an unsigned big-endian integer (the JWA "Base64urlUInt"
 * payload).
 *
 * Throws std::invalid_argument if the value is too large.
 */
UniqueBIGNUM<true>
DeserializeBIGNUM(std::span<const std::byte> src);

/**
 * Parse a SSH "mpint" (two's complement, must not be negative).
 */
UniqueBIGNUM<true>
DeserializeMpint(std::span<const std::byte> src);

} // namespace Avain
