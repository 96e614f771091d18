// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SymmetricKey.hxx"
#include "Signer.hxx"
#include "openssl/Unique.hxx"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Avain {

/**
 * The key material of a record.  Exactly one alternative is
 * populated.
 */
using KeyMaterial = std::variant<SymmetricKey, EcKey, RsaKey, Ed25519Key,
				 X25519Key, std::shared_ptr<const Signer>>;

enum class KeyFamily {
	/**
	 * An opaque signer which does not expose its public key.
	 */
	UNKNOWN,

	SYMMETRIC,
	EC_P256,
	EC_P384,
	EC_P521,
	RSA,
	ED25519,
	X25519,
};

[[gnu::pure]]
KeyFamily
GetKeyFamily(const KeyMaterial &key) noexcept;

[[gnu::pure]]
KeyFamily
GetKeyFamily(const PublicKeyMaterial &key) noexcept;

[[gnu::const]]
std::string_view
ToString(KeyFamily family) noexcept;

/**
 * Does this key contain no secret?  Symmetric keys and signers are
 * never public.
 */
[[gnu::pure]]
bool
IsPublicKey(const KeyMaterial &key) noexcept;

/**
 * Create the public part of the given key.  Throws
 * std::invalid_argument for symmetric keys and for signers which do
 * not expose their public key.
 */
KeyMaterial
ToPublicKey(const KeyMaterial &key);

/**
 * Wrap an OpenSSL key in #KeyMaterial.  Private EC and RSA keys are
 * stored as #EcKey / #RsaKey, Ed25519 and X25519 keys are converted
 * to their raw form.
 */
KeyMaterial
ToKeyMaterial(UniqueEVP_PKEY &&key);

/**
 * A key record (a JSON Web Key).
 */
struct JsonWebKey {
	KeyMaterial key;

	std::string key_id;
	std::string algorithm;
	std::string use;

	/**
	 * The "x5c" certificate chain, leaf first.
	 */
	std::vector<UniqueX509> certificates;

	/**
	 * The "x5t" and "x5t#S256" members (raw digests).
	 */
	std::vector<std::byte> certificate_thumbprint_sha1;
	std::vector<std::byte> certificate_thumbprint_sha256;

	JsonWebKey() = default;

	explicit JsonWebKey(KeyMaterial &&_key) noexcept
		:key(std::move(_key)) {}

	JsonWebKey(JsonWebKey &&) noexcept = default;
	JsonWebKey &operator=(JsonWebKey &&) noexcept = default;

	KeyFamily GetFamily() const noexcept {
		return GetKeyFamily(key);
	}

	bool IsPublic() const noexcept {
		return IsPublicKey(key);
	}

	bool IsSymmetric() const noexcept {
		return std::holds_alternative<SymmetricKey>(key);
	}

	/**
	 * Create the public-only copy of this record (with the same
	 * metadata and certificates).
	 */
	JsonWebKey Public() const;

	[[gnu::pure]]
	bool operator==(const JsonWebKey &other) const noexcept;
};

} // namespace Avain
