// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "EvpSigner.hxx"
#include "openssl/Sign.hxx"

#include <stdexcept>

namespace Avain {

static PublicKeyMaterial
MakePublicKey(EVP_PKEY &key)
{
	switch (EVP_PKEY_get_base_id(&key)) {
	case EVP_PKEY_EC:
		if (EcKey k{UpRef(key)}; k.IsPrivate())
			return k.PublicKey();
		break;

	case EVP_PKEY_RSA:
		if (RsaKey k{UpRef(key)}; k.IsPrivate())
			return k.PublicKey();
		break;

	default:
		throw std::invalid_argument{"Unsupported key type"};
	}

	throw std::invalid_argument{"Not a private key"};
}

EvpSigner::EvpSigner(UniqueEVP_PKEY &&_key)
	:key(std::move(_key)), public_key(MakePublicKey(*key))
{
}

std::vector<std::byte>
EvpSigner::Sign(std::span<const std::byte> digest,
		DigestAlgorithm hash_alg) const
{
	return SignDigest(*key, hash_alg, digest);
}

} // namespace Avain
