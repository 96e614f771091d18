// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Key.hxx"

#include <string_view>

namespace Avain {

namespace Algorithm {

using std::string_view_literals::operator""sv;

constexpr std::string_view HS256 = "HS256"sv;
constexpr std::string_view HS384 = "HS384"sv;
constexpr std::string_view HS512 = "HS512"sv;

constexpr std::string_view ES256 = "ES256"sv;
constexpr std::string_view ES384 = "ES384"sv;
constexpr std::string_view ES512 = "ES512"sv;

constexpr std::string_view RS256 = "RS256"sv;
constexpr std::string_view EDDSA = "EdDSA"sv;
constexpr std::string_view XEDDSA = "XEdDSA"sv;

constexpr std::string_view A256GCMKW = "A256GCMKW"sv;
constexpr std::string_view ECDH_ES = "ECDH-ES"sv;
constexpr std::string_view RSA_OAEP_256 = "RSA-OAEP-256"sv;

constexpr std::string_view PBES2_HS256_A128KW = "PBES2-HS256+A128KW"sv;
constexpr std::string_view PBES2_HS384_A192KW = "PBES2-HS384+A192KW"sv;
constexpr std::string_view PBES2_HS512_A256KW = "PBES2-HS512+A256KW"sv;

constexpr std::string_view A128GCM = "A128GCM"sv;
constexpr std::string_view A192GCM = "A192GCM"sv;
constexpr std::string_view A256GCM = "A256GCM"sv;
constexpr std::string_view A128CBC_HS256 = "A128CBC-HS256"sv;
constexpr std::string_view A192CBC_HS384 = "A192CBC-HS384"sv;
constexpr std::string_view A256CBC_HS512 = "A256CBC-HS512"sv;

} // namespace Algorithm

namespace KeyUse {

using std::string_view_literals::operator""sv;

constexpr std::string_view SIGNATURE = "sig"sv;
constexpr std::string_view ENCRYPTION = "enc"sv;

} // namespace KeyUse

/**
 * Determine the default algorithm for a key family and a usage hint
 * ("sig", "enc" or empty).  Returns an empty string if the family is
 * unknown (an opaque signer without a public key).
 */
[[gnu::const]]
std::string_view
InferAlgorithm(KeyFamily family, std::string_view use) noexcept;

[[gnu::pure]]
std::string_view
InferAlgorithm(const KeyMaterial &key, std::string_view use) noexcept;

/**
 * Is this algorithm name valid for a key of the given family?
 */
[[gnu::pure]]
bool
IsAlgorithmValid(KeyFamily family, std::string_view algorithm) noexcept;

/**
 * Is this an algorithm which operates on a shared secret (the
 * algorithms which allow treating raw bytes as a symmetric key)?
 */
[[gnu::pure]]
bool
IsSymmetricAlgorithm(std::string_view algorithm) noexcept;

} // namespace Avain
