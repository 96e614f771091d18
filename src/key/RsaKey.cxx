// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RsaKey.hxx"
#include "openssl/SerializeBN.hxx"
#include "openssl/EVP.hxx"
#include "openssl/Error.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_RSA_*
#include <openssl/err.h>

#include <stdexcept>

namespace Avain {

static UniqueEVP_PKEY
GenerateRsaKey(unsigned bits)
{
	UniqueEVP_PKEY key{EVP_RSA_gen(bits)};
	if (!key)
		throw SslError{"EVP_RSA_gen() failed"};

	return key;
}

RsaKey::RsaKey(Generate, unsigned bits)
	:key(GenerateRsaKey(bits)), is_private(true)
{
}

RsaKey::RsaKey(UniqueEVP_PKEY &&_key)
	:key(std::move(_key)),
	 is_private(GetOptionalBNParam<true>(*key, OSSL_PKEY_PARAM_RSA_D) != nullptr)
{
	if (EVP_PKEY_get_base_id(key.get()) != EVP_PKEY_RSA)
		throw std::invalid_argument{"Not a RSA key"};
}

RsaKey
RsaKey::FromComponents(std::span<const std::byte> n,
		       std::span<const std::byte> e,
		       const RsaPrivateComponents *priv)
{
	if (priv == nullptr)
		return RsaKey{DeserializeRSAPublic(n, e), false};

	auto key = DeserializeRSA(n, e, *priv);

	if (priv->HasCRT()) {
		const UniqueEVP_PKEY_CTX ctx{EVP_PKEY_CTX_new_from_pkey(nullptr, key.get(), nullptr)};
		if (!ctx)
			throw SslError{"EVP_PKEY_CTX_new_from_pkey() failed"};

		if (EVP_PKEY_pairwise_check(ctx.get()) != 1) {
			ERR_clear_error();
			throw std::invalid_argument{"Inconsistent RSA private key"};
		}
	}

	return RsaKey{std::move(key), true};
}

unsigned
RsaKey::GetBits() const noexcept
{
	return static_cast<unsigned>(EVP_PKEY_get_bits(key.get()));
}

std::vector<std::byte>
RsaKey::GetN() const
{
	return Serialize(*GetBNParam<false>(*key, OSSL_PKEY_PARAM_RSA_N));
}

std::vector<std::byte>
RsaKey::GetE() const
{
	return Serialize(*GetBNParam<false>(*key, OSSL_PKEY_PARAM_RSA_E));
}

static SecretBuffer
GetOptionalSecret(const EVP_PKEY &key, const char *name)
{
	const auto bn = GetOptionalBNParam<true>(key, name);
	if (!bn)
		return {};

	return SerializeSecret(*bn);
}

RsaKey::PrivateParams
RsaKey::GetPrivate() const
{
	return {
		SerializeSecret(*GetBNParam<true>(*key, OSSL_PKEY_PARAM_RSA_D)),
		GetOptionalSecret(*key, OSSL_PKEY_PARAM_RSA_FACTOR1),
		GetOptionalSecret(*key, OSSL_PKEY_PARAM_RSA_FACTOR2),
		GetOptionalSecret(*key, OSSL_PKEY_PARAM_RSA_EXPONENT1),
		GetOptionalSecret(*key, OSSL_PKEY_PARAM_RSA_EXPONENT2),
		GetOptionalSecret(*key, OSSL_PKEY_PARAM_RSA_COEFFICIENT1),
	};
}

RsaKey
RsaKey::PublicKey() const
{
	return FromComponents(GetN(), GetE(), nullptr);
}

bool
RsaKey::operator==(const RsaKey &other) const noexcept
{
	if (is_private != other.is_private ||
	    EVP_PKEY_eq(key.get(), other.key.get()) != 1)
		return false;

	if (!is_private)
		return true;

	const auto a = GetOptionalBNParam<true>(*key, OSSL_PKEY_PARAM_RSA_D);
	const auto b = GetOptionalBNParam<true>(*other.key, OSSL_PKEY_PARAM_RSA_D);
	return a && b && BN_cmp(a.get(), b.get()) == 0;
}

} // namespace Avain
