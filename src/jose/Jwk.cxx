// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Jwk.hxx"
#include "Base64.hxx"
#include "openssl/Error.hxx"

#include <openssl/x509.h>

#include <fmt/core.h>

#include <algorithm>
#include <stdexcept>

using std::string_view_literals::operator""sv;

namespace Avain {

static const std::string *
GetOptionalString(const nlohmann::json &j, const char *name)
{
	const auto i = j.find(name);
	if (i == j.end() || i->is_null())
		return nullptr;

	if (!i->is_string())
		throw std::invalid_argument{fmt::format("JWK member '{}' is not a string", name)};

	return &i->get_ref<const std::string &>();
}

static const std::string &
GetRequiredString(const nlohmann::json &j, const char *name)
{
	const auto *value = GetOptionalString(j, name);
	if (value == nullptr)
		throw std::invalid_argument{fmt::format("JWK member '{}' is missing", name)};

	return *value;
}

static std::vector<std::byte>
GetBytes(const nlohmann::json &j, const char *name)
try {
	return DecodeBase64Url(GetRequiredString(j, name));
} catch (const std::invalid_argument &) {
	std::throw_with_nested(std::invalid_argument{fmt::format("Malformed JWK member '{}'", name)});
}

static std::vector<std::byte>
GetOptionalBytes(const nlohmann::json &j, const char *name)
try {
	const auto *value = GetOptionalString(j, name);
	if (value == nullptr)
		return {};

	return DecodeBase64Url(*value);
} catch (const std::invalid_argument &) {
	std::throw_with_nested(std::invalid_argument{fmt::format("Malformed JWK member '{}'", name)});
}

/**
 * Decode an optional private member.  Returns an empty buffer if it
 * is absent.
 */
static SecretBuffer
GetOptionalSecret(const nlohmann::json &j, const char *name)
try {
	const auto *value = GetOptionalString(j, name);
	if (value == nullptr)
		return {};

	auto result = DecodeBase64UrlSecret(*value);
	if (result.empty())
		throw std::invalid_argument{"Empty value"};

	return result;
} catch (const std::invalid_argument &) {
	std::throw_with_nested(std::invalid_argument{fmt::format("Malformed JWK member '{}'", name)});
}

static std::span<const std::byte, 32>
Check32(std::span<const std::byte> src, const char *name)
{
	if (src.size() != 32)
		throw std::invalid_argument{fmt::format("Wrong size of JWK member '{}'", name)};

	return src.first<32>();
}

static KeyMaterial
DecodeEc(const nlohmann::json &j)
{
	const auto &crv = GetRequiredString(j, "crv");
	const auto curve = ParseCurveName(crv);
	if (!curve || GetCurveName(*curve) != crv)
		throw std::invalid_argument{"Unsupported EC curve"};

	const auto x = GetBytes(j, "x"), y = GetBytes(j, "y");
	const auto d = GetOptionalSecret(j, "d");
	return EcKey::FromCoordinates(*curve, x, y, d);
}

static KeyMaterial
DecodeRsa(const nlohmann::json &j)
{
	const auto n = GetBytes(j, "n"), e = GetBytes(j, "e");

	const auto d = GetOptionalSecret(j, "d");
	if (d.empty())
		return RsaKey::FromComponents(n, e, nullptr);

	if (j.contains("oth"))
		throw std::invalid_argument{"Multi-prime RSA keys are not supported"};

	const auto p = GetOptionalSecret(j, "p"), q = GetOptionalSecret(j, "q");
	if (p.empty() || q.empty())
		throw std::invalid_argument{"RSA private key is missing 'p' or 'q'"};

	const auto dp = GetOptionalSecret(j, "dp"), dq = GetOptionalSecret(j, "dq");
	const auto qi = GetOptionalSecret(j, "qi");

	const RsaPrivateComponents priv{d, p, q, dp, dq, qi};
	return RsaKey::FromComponents(n, e, &priv);
}

static KeyMaterial
DecodeOkp(const nlohmann::json &j)
{
	const auto &crv = GetRequiredString(j, "crv");
	const auto x_buffer = GetBytes(j, "x");
	const auto x = Check32(x_buffer, "x");
	const auto d = GetOptionalSecret(j, "d");

	if (crv == "Ed25519"sv) {
		if (d.empty())
			return Ed25519Key{x};

		auto key = Ed25519Key::FromSeed(Check32(d, "d"));
		if (!std::equal(x.begin(), x.end(), key.GetPublicKey().begin()))
			throw std::invalid_argument{"Ed25519 private key does not match the public key"};

		return key;
	} else if (crv == "X25519"sv) {
		if (d.empty())
			return X25519Key{x};

		auto key = X25519Key::FromPrivate(Check32(d, "d"));
		if (!std::equal(x.begin(), x.end(), key.GetPublicKey().begin()))
			throw std::invalid_argument{"X25519 private key does not match the public key"};

		return key;
	} else
		throw std::invalid_argument{"Unsupported OKP curve"};
}

static KeyMaterial
DecodeOct(const nlohmann::json &j)
{
	auto k = GetOptionalSecret(j, "k");
	if (k.empty())
		throw std::invalid_argument{"JWK member 'k' is missing"};

	return SymmetricKey{std::move(k)};
}

static KeyMaterial
DecodeKeyMaterial(const nlohmann::json &j)
{
	const auto &kty = GetRequiredString(j, "kty");
	if (kty == "EC"sv)
		return DecodeEc(j);
	else if (kty == "RSA"sv)
		return DecodeRsa(j);
	else if (kty == "OKP"sv)
		return DecodeOkp(j);
	else if (kty == "oct"sv)
		return DecodeOct(j);
	else
		throw std::invalid_argument{fmt::format("Unsupported key type '{}'", kty)};
}

static UniqueX509
DecodeCertificate(const nlohmann::json &j)
{
	if (!j.is_string())
		throw std::invalid_argument{"JWK member 'x5c' must contain strings"};

	const auto der = DecodeBase64(j.get_ref<const std::string &>());
	auto *p = reinterpret_cast<const unsigned char *>(der.data());
	UniqueX509 cert{d2i_X509(nullptr, &p, der.size())};
	if (!cert)
		throw SslError{"Malformed certificate in 'x5c'"};

	return cert;
}

static std::vector<std::byte>
CertificateDigest(const X509 &cert, const EVP_MD &md)
{
	std::vector<std::byte> result(EVP_MAX_MD_SIZE);
	unsigned length;
	if (!X509_digest(&cert, &md,
			 reinterpret_cast<unsigned char *>(result.data()),
			 &length))
		throw SslError{"X509_digest() failed"};

	result.resize(length);
	return result;
}

static bool
CertificateMatchesKey(const X509 &cert, const KeyMaterial &key)
try {
	EVP_PKEY *cert_key = X509_get0_pubkey(&cert);
	return cert_key != nullptr &&
		ToKeyMaterial(UpRef(*cert_key)) == ToPublicKey(key);
} catch (const std::invalid_argument &) {
	/* unsupported certificate key type or symmetric JWK */
	return false;
}

static void
DecodeCertificates(JsonWebKey &jwk, const nlohmann::json &j)
{
	if (const auto i = j.find("x5c"); i != j.end()) {
		if (!i->is_array())
			throw std::invalid_argument{"JWK member 'x5c' is not an array"};

		for (const auto &c : *i)
			jwk.certificates.emplace_back(DecodeCertificate(c));

		if (!jwk.certificates.empty() &&
		    !CertificateMatchesKey(*jwk.certificates.front(), jwk.key))
			throw std::invalid_argument{"The 'x5c' certificate does not match the key"};
	}

	jwk.certificate_thumbprint_sha1 = GetOptionalBytes(j, "x5t");
	if (!jwk.certificate_thumbprint_sha1.empty() &&
	    jwk.certificate_thumbprint_sha1.size() != 20)
		throw std::invalid_argument{"Wrong size of JWK member 'x5t'"};

	jwk.certificate_thumbprint_sha256 = GetOptionalBytes(j, "x5t#S256");
	if (!jwk.certificate_thumbprint_sha256.empty() &&
	    jwk.certificate_thumbprint_sha256.size() != 32)
		throw std::invalid_argument{"Wrong size of JWK member 'x5t#S256'"};

	if (!jwk.certificates.empty()) {
		const X509 &leaf = *jwk.certificates.front();

		if (!jwk.certificate_thumbprint_sha1.empty() &&
		    jwk.certificate_thumbprint_sha1 != CertificateDigest(leaf, *EVP_sha1()))
			throw std::invalid_argument{"The 'x5t' thumbprint does not match the certificate"};

		if (!jwk.certificate_thumbprint_sha256.empty() &&
		    jwk.certificate_thumbprint_sha256 != CertificateDigest(leaf, *EVP_sha256()))
			throw std::invalid_argument{"The 'x5t#S256' thumbprint does not match the certificate"};
	}
}

JsonWebKey
DecodeJwk(const nlohmann::json &j)
{
	if (!j.is_object())
		throw std::invalid_argument{"JWK is not an object"};

	JsonWebKey jwk{DecodeKeyMaterial(j)};

	if (const auto *s = GetOptionalString(j, "kid"))
		jwk.key_id = *s;

	if (const auto *s = GetOptionalString(j, "alg"))
		jwk.algorithm = *s;

	if (const auto *s = GetOptionalString(j, "use"))
		jwk.use = *s;

	DecodeCertificates(jwk, j);
	return jwk;
}

std::vector<JsonWebKey>
DecodeJwkSet(const nlohmann::json &j)
{
	if (!j.is_object())
		throw std::invalid_argument{"JWK set is not an object"};

	std::vector<JsonWebKey> result;

	const auto keys = j.find("keys");
	if (keys == j.end())
		return result;

	if (!keys->is_array())
		throw std::invalid_argument{"JWK set member 'keys' is not an array"};

	result.reserve(keys->size());
	for (std::size_t i = 0; i < keys->size(); ++i) {
		try {
			result.emplace_back(DecodeJwk((*keys)[i]));
		} catch (const std::exception &) {
			std::throw_with_nested(std::invalid_argument{fmt::format("Failed to decode key #{}", i)});
		}
	}

	return result;
}

namespace {

enum class EncodeMode {
	PUBLIC,
	PRIVATE,

	/**
	 * Public members only, but include "k" of symmetric keys.
	 */
	THUMBPRINT,
};

struct EncodeVisitor {
	nlohmann::json &j;
	EncodeMode mode;

	bool WantPrivate() const noexcept {
		return mode == EncodeMode::PRIVATE;
	}

	void operator()(const SymmetricKey &key) const {
		if (mode == EncodeMode::PUBLIC)
			throw std::invalid_argument{"Symmetric keys have no public part"};

		j["kty"] = "oct";
		j["k"] = EncodeBase64Url(key.secret);
	}

	void operator()(const EcKey &key) const {
		j["kty"] = "EC";
		j["crv"] = std::string{GetCurveName(key.GetCurve())};
		j["x"] = EncodeBase64Url(key.GetX());
		j["y"] = EncodeBase64Url(key.GetY());

		if (WantPrivate() && key.IsPrivate())
			j["d"] = EncodeBase64Url(key.GetD());
	}

	void operator()(const RsaKey &key) const {
		j["kty"] = "RSA";
		j["n"] = EncodeBase64Url(key.GetN());
		j["e"] = EncodeBase64Url(key.GetE());

		if (WantPrivate() && key.IsPrivate()) {
			const auto priv = key.GetPrivate();
			j["d"] = EncodeBase64Url(priv.d);

			if (!priv.p.empty()) {
				j["p"] = EncodeBase64Url(priv.p);
				j["q"] = EncodeBase64Url(priv.q);
				j["dp"] = EncodeBase64Url(priv.dp);
				j["dq"] = EncodeBase64Url(priv.dq);
				j["qi"] = EncodeBase64Url(priv.qi);
			}
		}
	}

	void operator()(const Ed25519Key &key) const {
		j["kty"] = "OKP";
		j["crv"] = "Ed25519";
		j["x"] = EncodeBase64Url(key.GetPublicKey());

		if (WantPrivate() && key.IsPrivate())
			j["d"] = EncodeBase64Url(key.GetSeed());
	}

	void operator()(const X25519Key &key) const {
		j["kty"] = "OKP";
		j["crv"] = "X25519";
		j["x"] = EncodeBase64Url(key.GetPublicKey());

		if (WantPrivate() && key.IsPrivate())
			j["d"] = EncodeBase64Url(key.GetPrivateKey());
	}

	void operator()(const std::shared_ptr<const Signer> &signer) const {
		/* the private part of a signer is never available */
		const auto *public_key = signer ? signer->GetPublicKey() : nullptr;
		if (public_key == nullptr)
			throw std::invalid_argument{"Signer does not expose its public key"};

		std::visit(*this, *public_key);
	}
};

} // anonymous namespace

static std::string
EncodeCertificate(X509 &cert)
{
	const int length = i2d_X509(&cert, nullptr);
	if (length < 0)
		throw SslError{"i2d_X509() failed"};

	std::vector<std::byte> der(length);
	auto *p = reinterpret_cast<unsigned char *>(der.data());
	if (i2d_X509(&cert, &p) != length)
		throw SslError{"i2d_X509() failed"};

	return EncodeBase64(der);
}

nlohmann::json
EncodeJwk(const JsonWebKey &jwk, bool include_private)
{
	auto j = nlohmann::json::object();
	std::visit(EncodeVisitor{j, include_private ? EncodeMode::PRIVATE : EncodeMode::PUBLIC},
		   jwk.key);

	if (!jwk.key_id.empty())
		j["kid"] = jwk.key_id;

	if (!jwk.algorithm.empty())
		j["alg"] = jwk.algorithm;

	if (!jwk.use.empty())
		j["use"] = jwk.use;

	if (!jwk.certificates.empty()) {
		auto &x5c = j["x5c"] = nlohmann::json::array();
		for (const auto &cert : jwk.certificates)
			x5c.push_back(EncodeCertificate(*cert));
	}

	if (!jwk.certificate_thumbprint_sha1.empty())
		j["x5t"] = EncodeBase64Url(jwk.certificate_thumbprint_sha1);

	if (!jwk.certificate_thumbprint_sha256.empty())
		j["x5t#S256"] = EncodeBase64Url(jwk.certificate_thumbprint_sha256);

	return j;
}

nlohmann::json
EncodeJwkSet(const std::vector<JsonWebKey> &keys, bool include_private)
{
	auto array = nlohmann::json::array();
	for (const auto &jwk : keys)
		array.push_back(EncodeJwk(jwk, include_private));

	return {{"keys", std::move(array)}};
}

nlohmann::json
EncodeRequiredMembers(const KeyMaterial &key)
{
	auto j = nlohmann::json::object();
	std::visit(EncodeVisitor{j, EncodeMode::THUMBPRINT}, key);
	return j;
}

} // namespace Avain
