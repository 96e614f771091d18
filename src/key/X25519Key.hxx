// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/SecretBuffer.hxx"

#include <array>
#include <cstddef>
#include <span>

namespace Avain {

/**
 * A X25519 key (RFC 8037 "OKP" with curve "X25519").
 */
class X25519Key {
	std::array<std::byte, 32> public_key;
	SecretBuffer private_key;

public:
	struct Generate{};
	explicit X25519Key(Generate);

	explicit X25519Key(std::span<const std::byte, 32> _public_key) noexcept;

	/**
	 * Construct a private key, deriving the public key from the
	 * scalar.
	 */
	static X25519Key FromPrivate(std::span<const std::byte, 32> scalar);

	bool IsPrivate() const noexcept {
		return !private_key.empty();
	}

	std::span<const std::byte, 32> GetPublicKey() const noexcept {
		return public_key;
	}

	std::span<const std::byte> GetPrivateKey() const noexcept {
		return private_key;
	}

	X25519Key PublicKey() const noexcept {
		return X25519Key{public_key};
	}

	bool operator==(const X25519Key &other) const noexcept {
		return public_key == other.public_key &&
			private_key == other.private_key;
	}
};

} // namespace Avain
