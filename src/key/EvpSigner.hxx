// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Signer.hxx"
#include "openssl/Unique.hxx"

namespace Avain {

/**
 * A #Signer backed by an OpenSSL private key (EC or RSA), e.g. one
 * loaded through an OpenSSL provider.
 */
class EvpSigner final : public Signer {
	UniqueEVP_PKEY key;
	PublicKeyMaterial public_key;

public:
	/**
	 * Throws std::invalid_argument if this is not a private EC
	 * or RSA key.
	 */
	explicit EvpSigner(UniqueEVP_PKEY &&_key);

	const PublicKeyMaterial *GetPublicKey() const noexcept override {
		return &public_key;
	}

	std::vector<std::byte> Sign(std::span<const std::byte> digest,
				    DigestAlgorithm hash_alg) const override;
};

} // namespace Avain
