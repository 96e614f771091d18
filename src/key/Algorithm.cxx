// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Algorithm.hxx"

#include <algorithm>
#include <array>

using std::string_view_literals::operator""sv;

namespace Avain {

std::string_view
InferAlgorithm(KeyFamily family, std::string_view use) noexcept
{
	const bool encryption = use == KeyUse::ENCRYPTION;

	switch (family) {
	case KeyFamily::UNKNOWN:
		break;

	case KeyFamily::SYMMETRIC:
		return encryption ? Algorithm::A256GCMKW : Algorithm::HS256;

	case KeyFamily::EC_P256:
		return encryption ? Algorithm::ECDH_ES : Algorithm::ES256;

	case KeyFamily::EC_P384:
		return encryption ? Algorithm::ECDH_ES : Algorithm::ES384;

	case KeyFamily::EC_P521:
		return encryption ? Algorithm::ECDH_ES : Algorithm::ES512;

	case KeyFamily::RSA:
		return encryption ? Algorithm::RSA_OAEP_256 : Algorithm::RS256;

	case KeyFamily::ED25519:
		return Algorithm::EDDSA;

	case KeyFamily::X25519:
		return Algorithm::XEDDSA;
	}

	return {};
}

std::string_view
InferAlgorithm(const KeyMaterial &key, std::string_view use) noexcept
{
	return InferAlgorithm(GetKeyFamily(key), use);
}

template<std::size_t N>
[[gnu::pure]]
static bool
Contains(const std::array<std::string_view, N> &list,
	 std::string_view value) noexcept
{
	return std::find(list.begin(), list.end(), value) != list.end();
}

static constexpr std::array symmetric_algorithms{
	"HS256"sv, "HS384"sv, "HS512"sv,
	"A128KW"sv, "A192KW"sv, "A256KW"sv,
	"A128GCMKW"sv, "A192GCMKW"sv, "A256GCMKW"sv,
	"A128GCM"sv, "A192GCM"sv, "A256GCM"sv,
	"A128CBC-HS256"sv, "A192CBC-HS384"sv, "A256CBC-HS512"sv,
	"dir"sv,
	"PBES2-HS256+A128KW"sv, "PBES2-HS384+A192KW"sv, "PBES2-HS512+A256KW"sv,
};

static constexpr std::array ecdh_algorithms{
	"ECDH-ES"sv, "ECDH-ES+A128KW"sv, "ECDH-ES+A192KW"sv, "ECDH-ES+A256KW"sv,
};

static constexpr std::array rsa_algorithms{
	"RS256"sv, "RS384"sv, "RS512"sv,
	"PS256"sv, "PS384"sv, "PS512"sv,
	"RSA1_5"sv, "RSA-OAEP"sv, "RSA-OAEP-256"sv,
};

bool
IsAlgorithmValid(KeyFamily family, std::string_view algorithm) noexcept
{
	switch (family) {
	case KeyFamily::UNKNOWN:
		/* nothing is known about an opaque signer */
		return true;

	case KeyFamily::SYMMETRIC:
		return Contains(symmetric_algorithms, algorithm);

	case KeyFamily::EC_P256:
		return algorithm == Algorithm::ES256 ||
			Contains(ecdh_algorithms, algorithm);

	case KeyFamily::EC_P384:
		return algorithm == Algorithm::ES384 ||
			Contains(ecdh_algorithms, algorithm);

	case KeyFamily::EC_P521:
		return algorithm == Algorithm::ES512 ||
			Contains(ecdh_algorithms, algorithm);

	case KeyFamily::RSA:
		return Contains(rsa_algorithms, algorithm);

	case KeyFamily::ED25519:
		return algorithm == Algorithm::EDDSA;

	case KeyFamily::X25519:
		return algorithm == Algorithm::XEDDSA ||
			Contains(ecdh_algorithms, algorithm);
	}

	return false;
}

bool
IsSymmetricAlgorithm(std::string_view algorithm) noexcept
{
	return Contains(symmetric_algorithms, algorithm);
}

} // namespace Avain
