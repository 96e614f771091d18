// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Digest.hxx"

#include <openssl/evp.h>

#include <cstddef>
#include <span>

namespace Avain {

/**
 * Verify a signature created by SignDigest() or SignMessage().
 *
 * @return true if the signature is valid
 */
bool
VerifyDigest(EVP_PKEY &key, DigestAlgorithm hash_alg,
	     std::span<const std::byte> digest,
	     std::span<const std::byte> signature);

bool
VerifyMessage(EVP_PKEY &key, DigestAlgorithm hash_alg,
	      std::span<const std::byte> message,
	      std::span<const std::byte> signature);

} // namespace Avain
