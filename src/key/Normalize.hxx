// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

namespace Avain {

struct Context;
struct JsonWebKey;

/**
 * Where a record was decoded from.  This decides which defaults
 * apply.
 */
enum class KeyOrigin {
	/**
	 * A JSON Web Key (alone or in a set).
	 */
	JWK,

	/**
	 * A PEM file; the key id defaults to the thumbprint.
	 */
	TEXTUAL,

	/**
	 * Raw bytes used as shared secret.
	 */
	RAW,
};

/**
 * Apply the context's overrides and the defaults to a freshly
 * decoded record:
 *
 * - "use" and "kid" from the context replace the record's values (a
 *   different key id in the record is an error unless "subtle")
 * - "alg" from the context replaces the record's value; otherwise an
 *   empty algorithm is inferred from the key family and "use"
 *   (unless "no defaults")
 * - the algorithm must be valid for the key family (unless "subtle")
 * - PEM keys without key id get their thumbprint (unless "no
 *   defaults")
 *
 * Throws #ValidationError.
 */
void
Normalize(JsonWebKey &jwk, const Context &ctx, KeyOrigin origin,
	  std::string_view source={});

} // namespace Avain
