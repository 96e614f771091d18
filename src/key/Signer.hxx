// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "EcKey.hxx"
#include "RsaKey.hxx"
#include "Ed25519Key.hxx"
#include "X25519Key.hxx"
#include "Digest.hxx"

#include <cstddef>
#include <span>
#include <variant>
#include <vector>

namespace Avain {

/**
 * The public key families.
 */
using PublicKeyMaterial = std::variant<EcKey, RsaKey, Ed25519Key, X25519Key>;

/**
 * A private key whose secret never leaves its owner (e.g. a key
 * management service or a hardware token).  Records carry it as an
 * opaque handle.
 */
class Signer {
public:
	virtual ~Signer() noexcept = default;

	/**
	 * @return the public key or nullptr if the backend does not
	 * expose it
	 */
	[[gnu::pure]]
	virtual const PublicKeyMaterial *GetPublicKey() const noexcept = 0;

	/**
	 * Sign a precomputed digest.
	 */
	virtual std::vector<std::byte> Sign(std::span<const std::byte> digest,
					    DigestAlgorithm hash_alg) const = 0;
};

} // namespace Avain
