// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "X25519Key.hxx"
#include "util/ByteSpan.hxx"
#include "util/Sodium.hxx"

#include <sodium/crypto_scalarmult_curve25519.h>
#include <sodium/randombytes.h>

#include <algorithm>
#include <stdexcept>

namespace Avain {

static void
DerivePublicKey(std::span<std::byte> public_key,
		std::span<const std::byte> private_key)
{
	static_assert(crypto_scalarmult_curve25519_BYTES == 32);
	static_assert(crypto_scalarmult_curve25519_SCALARBYTES == 32);

	if (crypto_scalarmult_curve25519_base(AsUnsigned(public_key),
					      AsUnsigned(private_key)) != 0)
		throw std::invalid_argument{"Invalid X25519 private key"};
}

X25519Key::X25519Key(Generate)
	:private_key(crypto_scalarmult_curve25519_SCALARBYTES)
{
	EnsureSodium();
	randombytes_buf(private_key.data(), private_key.size());
	DerivePublicKey(public_key, private_key);
}

X25519Key::X25519Key(std::span<const std::byte, 32> _public_key) noexcept
{
	std::copy(_public_key.begin(), _public_key.end(), public_key.begin());
}

X25519Key
X25519Key::FromPrivate(std::span<const std::byte, 32> scalar)
{
	EnsureSodium();

	std::array<std::byte, 32> pk;
	DerivePublicKey(pk, scalar);

	X25519Key key{pk};
	key.private_key = SecretBuffer{scalar};
	return key;
}

} // namespace Avain
