// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "key/Key.hxx"
#include "key/Set.hxx"
#include "jose/Jwe.hxx"

#include <cstddef>
#include <span>
#include <string_view>

namespace Avain {

struct Context;
class KeySource;

/**
 * Read a key from the given source: a JSON Web Key, a PEM file, an
 * encrypted container holding either of them, a key set (which
 * requires a key id in the context) or, with an explicit symmetric
 * algorithm, raw bytes.
 *
 * Throws a subclass of #Error; the cause is nested.
 */
JsonWebKey
ResolveKey(const KeySource &source, const Context &ctx);

/**
 * Read a key set (possibly encrypted) from the given source and
 * select the record with the key id from the context.  An object
 * without "keys" is an empty set.
 *
 * Throws #ClassificationError if the source is not a key set,
 * #NotFoundError or #AmbiguousKeyError if the key id does not match
 * exactly one record.
 */
JsonWebKey
ResolveKeySet(const KeySource &source, const Context &ctx);

/**
 * Like ResolveKey(), but for data in memory.
 */
JsonWebKey
ParseKey(std::span<const std::byte> data, const Context &ctx);

/**
 * Like ResolveKeySet(), but for data in memory.
 */
JsonWebKey
ParseKeySet(std::span<const std::byte> data, const Context &ctx);

/**
 * Encrypt a record (including its private members) with a password
 * ("PBES2-HS256+A128KW" and "A256GCM", content type "jwk+json").
 */
Jwe
EncryptKey(const JsonWebKey &jwk, std::span<const std::byte> password,
	   unsigned iterations=DEFAULT_PBES2_ITERATIONS);

/**
 * Encrypt a key set (content type "jwk-set+json").
 */
Jwe
EncryptKeySet(const KeySet &set, std::span<const std::byte> password,
	      unsigned iterations=DEFAULT_PBES2_ITERATIONS);

/**
 * Encrypt arbitrary data with a password.
 *
 * @param content_type the "cty" header value; omitted if empty
 *
 * Throws #ConfigurationError if the password is empty.
 */
Jwe
EncryptData(std::span<const std::byte> data,
	    std::span<const std::byte> password,
	    std::string_view content_type,
	    unsigned iterations=DEFAULT_PBES2_ITERATIONS);

} // namespace Avain
