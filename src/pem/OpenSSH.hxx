// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "key/Key.hxx"

#include <string_view>

namespace Avain {

/**
 * Decode an unencrypted OpenSSH private key file ("-----BEGIN
 * OPENSSH PRIVATE KEY-----").  Supports Ed25519, RSA and ECDSA on
 * the NIST curves.
 *
 * Throws std::invalid_argument on error.
 */
KeyMaterial
DecodeOpenSshPrivateKey(std::string_view src);

} // namespace Avain
