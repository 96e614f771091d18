// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/SecretBuffer.hxx"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Avain {

/**
 * The default PBES2 iteration count for new containers.
 */
constexpr unsigned DEFAULT_PBES2_ITERATIONS = 600'000;

/**
 * A parsed JSON Web Encryption container (RFC 7516), in either
 * serialization.
 */
struct Jwe {
	struct Recipient {
		/**
		 * The per-recipient unprotected header (JSON
		 * serialization only).
		 */
		nlohmann::json header = nlohmann::json::object();

		std::vector<std::byte> encrypted_key;
	};

	/**
	 * The protected header exactly as transmitted (base64url);
	 * it is part of the additional authenticated data.
	 */
	std::string protected_b64;

	nlohmann::json protected_header = nlohmann::json::object();

	/**
	 * The shared unprotected header (JSON serialization only).
	 */
	nlohmann::json unprotected = nlohmann::json::object();

	std::vector<Recipient> recipients;

	std::vector<std::byte> iv, ciphertext, tag;

	/**
	 * The "aad" member as transmitted (JSON serialization only).
	 */
	std::string aad_b64;

	/**
	 * Parse the compact serialization (five base64url parts
	 * separated by dots).  Throws std::invalid_argument on error.
	 */
	static Jwe ParseCompact(std::string_view s);

	/**
	 * Parse the general or flattened JSON serialization.  Throws
	 * std::invalid_argument on error.
	 */
	static Jwe ParseJson(const nlohmann::json &j);

	/**
	 * Parse either serialization.
	 */
	static Jwe Parse(std::string_view s);

	/**
	 * Throws std::invalid_argument if the container cannot be
	 * expressed in the compact serialization.
	 */
	std::string CompactSerialize() const;

	/**
	 * Serialize as JSON (flattened for a single recipient).
	 */
	std::string FullSerialize() const;

	/**
	 * Merge the protected, the shared and the per-recipient
	 * header.  Throws std::invalid_argument if a member appears
	 * more than once.
	 */
	nlohmann::json GetHeader(const Recipient &recipient) const;
};

/**
 * Decrypt a password-protected container ("PBES2-*" key
 * management).  Each recipient is tried in turn.
 *
 * Throws #AuthenticationFailure if no recipient can be decrypted
 * with this password or if the content fails authentication,
 * std::invalid_argument if the container is malformed or uses
 * unsupported algorithms.
 */
SecretBuffer
DecryptJwe(const Jwe &jwe, std::span<const std::byte> password);

/**
 * Encrypt data with "PBES2-HS256+A128KW" and "A256GCM".
 *
 * @param content_type the "cty" header value; omitted if empty
 */
Jwe
EncryptJwe(std::span<const std::byte> plaintext,
	   std::span<const std::byte> password,
	   std::string_view content_type,
	   unsigned iterations=DEFAULT_PBES2_ITERATIONS);

} // namespace Avain
