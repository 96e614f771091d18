// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Key.hxx"
#include "Digest.hxx"

#include <cstddef>
#include <string>
#include <vector>

namespace Avain {

/**
 * Calculate the RFC 7638 thumbprint of a key.  The private and the
 * public form of a key have the same thumbprint.
 *
 * Throws std::invalid_argument if the key is an opaque signer
 * without public key.
 */
std::vector<std::byte>
Thumbprint(const KeyMaterial &key, DigestAlgorithm a);

/**
 * Like Thumbprint(), but encoded with base64url without padding, the
 * form used as default key id.
 */
std::string
ThumbprintString(const KeyMaterial &key,
		 DigestAlgorithm a=DigestAlgorithm::SHA256);

/**
 * Check that the key id of a private (or symmetric) key is its
 * SHA-256 thumbprint.  Public keys and records without a key id
 * always pass.
 *
 * Throws #ValidationError on mismatch.
 */
void
VerifyKeyId(const JsonWebKey &jwk);

} // namespace Avain
