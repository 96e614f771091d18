// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Key.hxx"
#include "openssl/EVP.hxx"
#include "openssl/Error.hxx"

#include <openssl/core_names.h>
#include <openssl/err.h>

#include <sodium/utils.h>

#include <algorithm>
#include <array>
#include <stdexcept>

using std::string_view_literals::operator""sv;

namespace Avain {

static constexpr KeyFamily
GetFamily(const SymmetricKey &) noexcept
{
	return KeyFamily::SYMMETRIC;
}

static KeyFamily
GetFamily(const EcKey &key) noexcept
{
	switch (key.GetCurve()) {
	case EcCurve::P256:
		return KeyFamily::EC_P256;

	case EcCurve::P384:
		return KeyFamily::EC_P384;

	case EcCurve::P521:
		return KeyFamily::EC_P521;
	}

	return KeyFamily::UNKNOWN;
}

static constexpr KeyFamily
GetFamily(const RsaKey &) noexcept
{
	return KeyFamily::RSA;
}

static constexpr KeyFamily
GetFamily(const Ed25519Key &) noexcept
{
	return KeyFamily::ED25519;
}

static constexpr KeyFamily
GetFamily(const X25519Key &) noexcept
{
	return KeyFamily::X25519;
}

KeyFamily
GetKeyFamily(const PublicKeyMaterial &key) noexcept
{
	return std::visit([](const auto &k){ return GetFamily(k); }, key);
}

static KeyFamily
GetFamily(const std::shared_ptr<const Signer> &signer) noexcept
{
	const auto *public_key = signer ? signer->GetPublicKey() : nullptr;
	if (public_key == nullptr)
		return KeyFamily::UNKNOWN;

	return GetKeyFamily(*public_key);
}

KeyFamily
GetKeyFamily(const KeyMaterial &key) noexcept
{
	return std::visit([](const auto &k){ return GetFamily(k); }, key);
}

std::string_view
ToString(KeyFamily family) noexcept
{
	switch (family) {
	case KeyFamily::UNKNOWN:
		break;

	case KeyFamily::SYMMETRIC:
		return "oct"sv;

	case KeyFamily::EC_P256:
		return "EC P-256"sv;

	case KeyFamily::EC_P384:
		return "EC P-384"sv;

	case KeyFamily::EC_P521:
		return "EC P-521"sv;

	case KeyFamily::RSA:
		return "RSA"sv;

	case KeyFamily::ED25519:
		return "OKP Ed25519"sv;

	case KeyFamily::X25519:
		return "OKP X25519"sv;
	}

	return "unknown"sv;
}

struct IsPublicVisitor {
	bool operator()(const SymmetricKey &) const noexcept {
		return false;
	}

	bool operator()(const std::shared_ptr<const Signer> &) const noexcept {
		return false;
	}

	template<typename T>
	bool operator()(const T &key) const noexcept {
		return !key.IsPrivate();
	}
};

bool
IsPublicKey(const KeyMaterial &key) noexcept
{
	return std::visit(IsPublicVisitor{}, key);
}

struct ToPublicVisitor {
	KeyMaterial operator()(const SymmetricKey &) const {
		throw std::invalid_argument{"Symmetric keys have no public part"};
	}

	KeyMaterial operator()(const std::shared_ptr<const Signer> &signer) const {
		const auto *public_key = signer ? signer->GetPublicKey() : nullptr;
		if (public_key == nullptr)
			throw std::invalid_argument{"Signer does not expose its public key"};

		return std::visit([](const auto &k) -> KeyMaterial {
			return k.PublicKey();
		}, *public_key);
	}

	template<typename T>
	KeyMaterial operator()(const T &key) const {
		return key.PublicKey();
	}
};

KeyMaterial
ToPublicKey(const KeyMaterial &key)
{
	return std::visit(ToPublicVisitor{}, key);
}

template<std::size_t size>
static std::span<const std::byte, size>
GetRawKey(const EVP_PKEY &key, std::array<std::byte, size> &buffer,
	  bool is_private)
{
	std::size_t length = buffer.size();
	auto *p = reinterpret_cast<unsigned char *>(buffer.data());
	if ((is_private
	     ? EVP_PKEY_get_raw_private_key(&key, p, &length)
	     : EVP_PKEY_get_raw_public_key(&key, p, &length)) != 1 ||
	    length != size)
		throw SslError{"Failed to obtain raw key"};

	return buffer;
}

static bool
HasPrivateOctets(const EVP_PKEY &key) noexcept
{
	std::size_t length = 0;
	if (EVP_PKEY_get_octet_string_param(&key, OSSL_PKEY_PARAM_PRIV_KEY,
					    nullptr, 0, &length) != 1) {
		ERR_clear_error();
		return false;
	}

	return length > 0;
}

KeyMaterial
ToKeyMaterial(UniqueEVP_PKEY &&key)
{
	switch (EVP_PKEY_get_base_id(key.get())) {
	case EVP_PKEY_EC:
		return EcKey{std::move(key)};

	case EVP_PKEY_RSA:
		return RsaKey{std::move(key)};

	case EVP_PKEY_ED25519:
		{
			std::array<std::byte, 32> buffer;
			if (HasPrivateOctets(*key)) {
				auto k = Ed25519Key::FromSeed(GetRawKey(*key, buffer, true));
				sodium_memzero(buffer.data(), buffer.size());
				return k;
			}

			return Ed25519Key{GetRawKey(*key, buffer, false)};
		}

	case EVP_PKEY_X25519:
		{
			std::array<std::byte, 32> buffer;
			if (HasPrivateOctets(*key)) {
				auto k = X25519Key::FromPrivate(GetRawKey(*key, buffer, true));
				sodium_memzero(buffer.data(), buffer.size());
				return k;
			}

			return X25519Key{GetRawKey(*key, buffer, false)};
		}
	}

	throw std::invalid_argument{"Unsupported key type"};
}

JsonWebKey
JsonWebKey::Public() const
{
	JsonWebKey result{ToPublicKey(key)};
	result.key_id = key_id;
	result.algorithm = algorithm;
	result.use = use;

	for (const auto &i : certificates)
		result.certificates.emplace_back(UpRef(*i));

	result.certificate_thumbprint_sha1 = certificate_thumbprint_sha1;
	result.certificate_thumbprint_sha256 = certificate_thumbprint_sha256;
	return result;
}

bool
JsonWebKey::operator==(const JsonWebKey &other) const noexcept
{
	return key == other.key &&
		key_id == other.key_id &&
		algorithm == other.algorithm &&
		use == other.use &&
		std::equal(certificates.begin(), certificates.end(),
			   other.certificates.begin(), other.certificates.end(),
			   [](const UniqueX509 &a, const UniqueX509 &b){
				   return X509_cmp(a.get(), b.get()) == 0;
			   }) &&
		certificate_thumbprint_sha1 == other.certificate_thumbprint_sha1 &&
		certificate_thumbprint_sha256 == other.certificate_thumbprint_sha256;
}

} // namespace Avain
