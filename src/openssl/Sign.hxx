// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Digest.hxx"

#include <openssl/evp.h>

#include <cstddef>
#include <span>
#include <vector>

namespace Avain {

/**
 * Sign a precomputed digest with a private key.  ECDSA signatures
 * are DER-encoded, RSA signatures use PKCS#1 v1.5 padding.
 */
std::vector<std::byte>
SignDigest(EVP_PKEY &key, DigestAlgorithm hash_alg,
	   std::span<const std::byte> digest);

/**
 * Hash the message and sign the digest.
 */
std::vector<std::byte>
SignMessage(EVP_PKEY &key, DigestAlgorithm hash_alg,
	    std::span<const std::byte> src);

} // namespace Avain
