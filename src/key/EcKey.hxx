// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "openssl/Unique.hxx"
#include "util/SecretBuffer.hxx"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace Avain {

enum class EcCurve {
	P256,
	P384,
	P521,
};

/**
 * @return the JWA name of the curve, e.g. "P-256"
 */
[[gnu::const]]
std::string_view
GetCurveName(EcCurve curve) noexcept;

/**
 * @return the size of one coordinate (and of the private scalar) in
 * bytes
 */
[[gnu::const]]
std::size_t
GetCoordinateSize(EcCurve curve) noexcept;

/**
 * Parse a JWA curve name or an OpenSSL group name.
 */
[[gnu::pure]]
std::optional<EcCurve>
ParseCurveName(std::string_view name) noexcept;

/**
 * An elliptic curve key on one of the NIST curves, either public or
 * private.
 */
class EcKey {
	EcCurve curve;
	UniqueEVP_PKEY key;
	bool is_private;

public:
	struct Generate {};
	EcKey(Generate, EcCurve _curve);

	/**
	 * Take ownership of an OpenSSL key.  Throws
	 * std::invalid_argument if it is not an EC key on a supported
	 * curve.
	 */
	explicit EcKey(UniqueEVP_PKEY &&_key);

	EcKey(EcKey &&) noexcept = default;
	EcKey &operator=(EcKey &&) noexcept = default;

	/**
	 * Construct a key from its JWK coordinates.  The point (and
	 * the private scalar if given) is validated.
	 *
	 * @param d the private scalar or an empty span for a public
	 * key
	 */
	static EcKey FromCoordinates(EcCurve curve,
				     std::span<const std::byte> x,
				     std::span<const std::byte> y,
				     std::span<const std::byte> d);

	EcCurve GetCurve() const noexcept {
		return curve;
	}

	bool IsPrivate() const noexcept {
		return is_private;
	}

	EVP_PKEY &Get() const noexcept {
		return *key;
	}

	std::vector<std::byte> GetX() const;
	std::vector<std::byte> GetY() const;

	/**
	 * Return the private scalar.  Must only be called on a
	 * private key.
	 */
	SecretBuffer GetD() const;

	/**
	 * Create a new public-only key with the same public point.
	 */
	EcKey PublicKey() const;

	[[gnu::pure]]
	bool operator==(const EcKey &other) const noexcept;

private:
	EcKey(EcCurve _curve, UniqueEVP_PKEY &&_key, bool _is_private) noexcept
		:curve(_curve), key(std::move(_key)), is_private(_is_private) {}
};

} // namespace Avain
