// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Ed25519Key.hxx"
#include "util/ByteSpan.hxx"
#include "util/Sodium.hxx"

#include <sodium/crypto_sign_ed25519.h>
#include <sodium/crypto_verify_32.h>
#include <sodium/randombytes.h>
#include <sodium/utils.h>

#include <algorithm>
#include <stdexcept>

namespace Avain {

Ed25519Key::Ed25519Key(Generate)
	:seed(crypto_sign_ed25519_SEEDBYTES)
{
	EnsureSodium();
	randombytes_buf(seed.data(), seed.size());

	std::array<std::byte, crypto_sign_ed25519_SECRETKEYBYTES> secret_key;
	crypto_sign_ed25519_seed_keypair(AsUnsigned(std::span<std::byte>{public_key}),
					 AsUnsigned(std::span<std::byte>{secret_key}),
					 AsUnsigned(seed.GetSpan()));
	sodium_memzero(secret_key.data(), secret_key.size());
}

Ed25519Key::Ed25519Key(std::span<const std::byte, 32> _public_key) noexcept
{
	static_assert(sizeof(public_key) == crypto_sign_ed25519_PUBLICKEYBYTES);

	std::copy(_public_key.begin(), _public_key.end(), public_key.begin());
}

Ed25519Key
Ed25519Key::FromSeed(std::span<const std::byte, 32> _seed)
{
	static_assert(crypto_sign_ed25519_SEEDBYTES == 32);

	EnsureSodium();

	std::array<std::byte, crypto_sign_ed25519_PUBLICKEYBYTES> pk;
	std::array<std::byte, crypto_sign_ed25519_SECRETKEYBYTES> sk;
	crypto_sign_ed25519_seed_keypair(AsUnsigned(std::span<std::byte>{pk}),
					 AsUnsigned(std::span<std::byte>{sk}),
					 AsUnsigned(_seed));
	sodium_memzero(sk.data(), sk.size());

	Ed25519Key key{pk};
	key.seed = SecretBuffer{_seed};
	return key;
}

Ed25519Key
Ed25519Key::FromKeyPair(std::span<const std::byte, 32> _public_key,
			std::span<const std::byte, 64> secret_key)
{
	auto key = FromSeed(secret_key.first<32>());

	if (crypto_verify_32(AsUnsigned(key.GetPublicKey()),
			     AsUnsigned(_public_key)) != 0 ||
	    crypto_verify_32(AsUnsigned(key.GetPublicKey()),
			     AsUnsigned(secret_key.last<32>())) != 0)
		throw std::invalid_argument{"Ed25519 public key does not match the private key"};

	return key;
}

} // namespace Avain
