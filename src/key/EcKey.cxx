// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "EcKey.hxx"
#include "openssl/DeserializeEC.hxx"
#include "openssl/SerializeBN.hxx"
#include "openssl/EVP.hxx"
#include "openssl/Error.hxx"

#include <openssl/core_names.h>
#include <openssl/err.h>

#include <stdexcept>
#include <string>

using std::string_view_literals::operator""sv;

namespace Avain {

std::string_view
GetCurveName(EcCurve curve) noexcept
{
	switch (curve) {
	case EcCurve::P256:
		return "P-256"sv;

	case EcCurve::P384:
		return "P-384"sv;

	case EcCurve::P521:
		return "P-521"sv;
	}

	return {};
}

std::size_t
GetCoordinateSize(EcCurve curve) noexcept
{
	switch (curve) {
	case EcCurve::P256:
		return 32;

	case EcCurve::P384:
		return 48;

	case EcCurve::P521:
		return 66;
	}

	return 0;
}

std::optional<EcCurve>
ParseCurveName(std::string_view name) noexcept
{
	if (name == "P-256"sv || name == "prime256v1"sv || name == "secp256r1"sv)
		return EcCurve::P256;
	else if (name == "P-384"sv || name == "secp384r1"sv)
		return EcCurve::P384;
	else if (name == "P-521"sv || name == "secp521r1"sv)
		return EcCurve::P521;
	else
		return std::nullopt;
}

static EcCurve
GetCurve(const EVP_PKEY &key)
{
	if (EVP_PKEY_get_base_id(&key) != EVP_PKEY_EC)
		throw std::invalid_argument{"Not an EC key"};

	char name[64];
	std::size_t length;
	if (!EVP_PKEY_get_group_name(&key, name, sizeof(name), &length))
		throw SslError{"EVP_PKEY_get_group_name() failed"};

	const auto curve = ParseCurveName({name, length});
	if (!curve)
		throw std::invalid_argument{"Unsupported EC curve"};

	return *curve;
}

static bool
HasPrivateKey(const EVP_PKEY &key) noexcept
{
	return GetOptionalBNParam<true>(key, OSSL_PKEY_PARAM_PRIV_KEY) != nullptr;
}

static std::string
MakeCurveString(EcCurve curve)
{
	return std::string{GetCurveName(curve)};
}

static UniqueEVP_PKEY
GenerateEcKey(EcCurve curve)
{
	UniqueEVP_PKEY key{EVP_EC_gen(MakeCurveString(curve).c_str())};
	if (!key)
		throw SslError{"EVP_EC_gen() failed"};

	return key;
}

EcKey::EcKey(Generate, EcCurve _curve)
	:curve(_curve), key(GenerateEcKey(_curve)), is_private(true)
{
}

EcKey::EcKey(UniqueEVP_PKEY &&_key)
	:curve(Avain::GetCurve(*_key)), key(std::move(_key)),
	 is_private(HasPrivateKey(*key))
{
}

static void
CheckKey(EVP_PKEY &key, bool is_private)
{
	const UniqueEVP_PKEY_CTX ctx{EVP_PKEY_CTX_new_from_pkey(nullptr, &key, nullptr)};
	if (!ctx)
		throw SslError{"EVP_PKEY_CTX_new_from_pkey() failed"};

	if (EVP_PKEY_public_check(ctx.get()) != 1) {
		ERR_clear_error();
		throw std::invalid_argument{"Invalid EC point"};
	}

	if (is_private && EVP_PKEY_pairwise_check(ctx.get()) != 1) {
		ERR_clear_error();
		throw std::invalid_argument{"EC private key does not match the public key"};
	}
}

EcKey
EcKey::FromCoordinates(EcCurve curve,
		       std::span<const std::byte> x,
		       std::span<const std::byte> y,
		       std::span<const std::byte> d)
{
	const std::size_t size = GetCoordinateSize(curve);
	if (x.size() != size || y.size() != size)
		throw std::invalid_argument{"Wrong EC coordinate size"};

	if (!d.empty() && d.size() != size)
		throw std::invalid_argument{"Wrong EC private key size"};

	std::vector<std::byte> q;
	q.reserve(1 + 2 * size);
	q.push_back(std::byte{0x04});
	q.insert(q.end(), x.begin(), x.end());
	q.insert(q.end(), y.begin(), y.end());

	const bool is_private = !d.empty();
	auto key = is_private
		? DeserializeEC(GetCurveName(curve), q, d)
		: DeserializeECPublic(GetCurveName(curve), q);

	CheckKey(*key, is_private);
	return EcKey{curve, std::move(key), is_private};
}

std::vector<std::byte>
EcKey::GetX() const
{
	return SerializePadded(*GetBNParam<false>(*key, OSSL_PKEY_PARAM_EC_PUB_X),
			       GetCoordinateSize(curve));
}

std::vector<std::byte>
EcKey::GetY() const
{
	return SerializePadded(*GetBNParam<false>(*key, OSSL_PKEY_PARAM_EC_PUB_Y),
			       GetCoordinateSize(curve));
}

SecretBuffer
EcKey::GetD() const
{
	return SerializeSecretPadded(*GetBNParam<true>(*key, OSSL_PKEY_PARAM_PRIV_KEY),
				     GetCoordinateSize(curve));
}

EcKey
EcKey::PublicKey() const
{
	return FromCoordinates(curve, GetX(), GetY(), {});
}

bool
EcKey::operator==(const EcKey &other) const noexcept
{
	if (curve != other.curve || is_private != other.is_private ||
	    EVP_PKEY_eq(key.get(), other.key.get()) != 1)
		return false;

	if (!is_private)
		return true;

	const auto a = GetOptionalBNParam<true>(*key, OSSL_PKEY_PARAM_PRIV_KEY);
	const auto b = GetOptionalBNParam<true>(*other.key, OSSL_PKEY_PARAM_PRIV_KEY);
	return a && b && BN_cmp(a.get(), b.get()) == 0;
}

} // namespace Avain
