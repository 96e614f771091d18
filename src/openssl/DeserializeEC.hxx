// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"

#include <cstddef>
#include <span>
#include <string_view>

namespace Avain {

/**
 * Construct an EC public key from an uncompressed point.
 *
 * @param curve_name an OpenSSL group name, e.g. "P-256"
 * @param q the encoded point (0x04 || X || Y)
 */
UniqueEVP_PKEY
DeserializeECPublic(std::string_view curve_name, std::span<const std::byte> q);

/**
 * Construct an EC private key.
 *
 * @param d the big-endian private scalar
 */
UniqueEVP_PKEY
DeserializeEC(std::string_view curve_name, std::span<const std::byte> q,
	      std::span<const std::byte> d);

} // namespace Avain
