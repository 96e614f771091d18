// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "key/Key.hxx"

#include <nlohmann/json.hpp>

#include <vector>

namespace Avain {

/**
 * Decode a JSON Web Key (RFC 7517, 7518, 8037).  The key material
 * is validated (points on the curve, matching private and public
 * parts, matching certificate chain and thumbprints).
 *
 * Throws std::invalid_argument if the object is malformed.
 */
JsonWebKey
DecodeJwk(const nlohmann::json &j);

/**
 * Decode the "keys" array of a JSON Web Key Set.  An object without
 * "keys" is an empty set.
 */
std::vector<JsonWebKey>
DecodeJwkSet(const nlohmann::json &j);

/**
 * Encode a record as JSON Web Key.
 *
 * @param include_private include the private members; if false,
 * symmetric keys cannot be encoded
 */
nlohmann::json
EncodeJwk(const JsonWebKey &jwk, bool include_private);

nlohmann::json
EncodeJwkSet(const std::vector<JsonWebKey> &keys, bool include_private);

/**
 * Encode only the members which are required for the key type (RFC
 * 7638 section 3.2): the input of the thumbprint.
 */
nlohmann::json
EncodeRequiredMembers(const KeyMaterial &key);

} // namespace Avain
