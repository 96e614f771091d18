// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/SecretBuffer.hxx"

#include <openssl/bn.h>

#include <cstddef>
#include <vector>

namespace Avain {

/**
 * Serialize a non-negative BIGNUM as an unsigned big-endian octet
 * string without leading zeroes (the JWA "Base64urlUInt" payload).
 * Zero is serialized as a single zero byte.
 */
std::vector<std::byte>
Serialize(const BIGNUM &bn);

/**
 * Serialize a BIGNUM as an unsigned big-endian octet string padded
 * with leading zeroes to exactly #size bytes.
 */
std::vector<std::byte>
SerializePadded(const BIGNUM &bn, std::size_t size);

/**
 * Like Serialize(), but for private key components.
 */
SecretBuffer
SerializeSecret(const BIGNUM &bn);

SecretBuffer
SerializeSecretPadded(const BIGNUM &bn, std::size_t size);

} // namespace Avain
