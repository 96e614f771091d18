// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Digest.hxx"
#include "util/SecretBuffer.hxx"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace Avain {

/**
 * Upper bound for the PBES2 iteration count ("p2c") accepted when
 * decrypting, to bound the work an attacker-supplied container can
 * cause.
 */
constexpr unsigned PBES2_MAX_ITERATIONS = 10'000'000;

/**
 * The minimum salt input ("p2s") size required by RFC 7518 4.8.1.1.
 */
constexpr std::size_t PBES2_MIN_SALT_SIZE = 8;

struct Pbes2Algorithm {
	DigestAlgorithm hash;

	/**
	 * The size of the AES key wrap key.
	 */
	std::size_t key_size;
};

/**
 * Parse a "PBES2-HS*+A*KW" algorithm name.
 */
[[gnu::pure]]
std::optional<Pbes2Algorithm>
ParsePbes2Algorithm(std::string_view alg) noexcept;

/**
 * Derive the key encryption key with PBKDF2.  The salt is "alg ||
 * 0x00 || p2s".
 */
SecretBuffer
DerivePbes2Key(std::string_view alg, std::span<const std::byte> password,
	       std::span<const std::byte> salt_input, unsigned iterations);

/**
 * AES key wrap (RFC 3394).
 */
std::vector<std::byte>
WrapKey(std::span<const std::byte> kek, std::span<const std::byte> cek);

/**
 * AES key unwrap (RFC 3394).  Throws #AuthenticationFailure if the
 * integrity check fails (usually a wrong password).
 */
SecretBuffer
UnwrapKey(std::span<const std::byte> kek, std::span<const std::byte> wrapped);

} // namespace Avain
