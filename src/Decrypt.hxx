// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Classify.hxx"
#include "util/SecretBuffer.hxx"

#include <cstddef>
#include <span>
#include <string_view>

namespace Avain {

struct Context;

/**
 * How many encrypted containers may be nested.  A container which
 * is still encrypted after this many passes is rejected.
 */
constexpr unsigned max_decryption_passes = 1;

/**
 * Decrypt a password-protected container.  The password is
 * obtained from the context only now.
 *
 * @param source the name of the source for the password prompt
 * and for error messages
 *
 * Throws #AuthenticationFailure on a wrong password,
 * #ClassificationError if the container is malformed or not
 * supported.
 */
SecretBuffer
DecryptContainer(std::span<const std::byte> data, const Context &ctx,
		 std::string_view source);

struct UnwrappedPayload {
	SecretBuffer data;
	KeyFormat format;
};

/**
 * Classify the data; if it is encrypted, decrypt it and classify
 * the plaintext again.  The result is never an encrypted container.
 */
UnwrappedPayload
Unwrap(SecretBuffer &&data, const Context &ctx, std::string_view source);

} // namespace Avain
