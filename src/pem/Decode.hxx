// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "key/Key.hxx"
#include "util/SecretBuffer.hxx"

#include <cstddef>
#include <functional>
#include <span>
#include <string_view>

namespace Avain {

/**
 * Obtains the password for an encrypted private key.  It is only
 * invoked if the key is actually encrypted.
 */
using PemPasswordFunction = std::function<SecretBuffer()>;

/**
 * Return the label of the first PEM block which is not "EC
 * PARAMETERS", e.g. "PRIVATE KEY".  Returns an empty string if there
 * is none.
 */
[[gnu::pure]]
std::string_view
GetPemLabel(std::string_view src) noexcept;

/**
 * Decode a PEM file: a private key (PKCS#8, possibly encrypted,
 * "RSA PRIVATE KEY", "EC PRIVATE KEY", "OPENSSH PRIVATE KEY"), a
 * public key ("PUBLIC KEY", "RSA PUBLIC KEY") or a certificate
 * chain.  For certificates, the record contains the leaf's public
 * key and the whole chain.
 *
 * Throws #AuthenticationFailure if an encrypted key cannot be
 * decrypted with the password, #SslError or std::invalid_argument if
 * the input is malformed.
 */
JsonWebKey
DecodePem(std::span<const std::byte> src,
	  const PemPasswordFunction &get_password);

} // namespace Avain
