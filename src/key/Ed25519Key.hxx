// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/SecretBuffer.hxx"

#include <array>
#include <cstddef>
#include <span>

namespace Avain {

/**
 * An Ed25519 key (RFC 8037 "OKP" with curve "Ed25519").  The private
 * part is stored as the 32 byte seed, which is what JWK calls "d".
 */
class Ed25519Key {
	std::array<std::byte, 32> public_key;
	SecretBuffer seed;

public:
	struct Generate{};
	explicit Ed25519Key(Generate);

	explicit Ed25519Key(std::span<const std::byte, 32> _public_key) noexcept;

	static Ed25519Key FromSeed(std::span<const std::byte, 32> seed);

	/**
	 * Construct a private key from a public key and a libsodium
	 * secret key (seed followed by the public key), as stored in
	 * OpenSSH private key files.  Throws std::invalid_argument
	 * if the two do not match.
	 */
	static Ed25519Key FromKeyPair(std::span<const std::byte, 32> _public_key,
				      std::span<const std::byte, 64> secret_key);

	bool IsPrivate() const noexcept {
		return !seed.empty();
	}

	std::span<const std::byte, 32> GetPublicKey() const noexcept {
		return public_key;
	}

	std::span<const std::byte> GetSeed() const noexcept {
		return seed;
	}

	Ed25519Key PublicKey() const noexcept {
		return Ed25519Key{public_key};
	}

	bool operator==(const Ed25519Key &other) const noexcept {
		return public_key == other.public_key && seed == other.seed;
	}
};

} // namespace Avain
