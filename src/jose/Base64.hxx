// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/SecretBuffer.hxx"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Avain {

/**
 * Encode with the "base64url" alphabet and without padding, as used
 * by all JOSE members.
 */
std::string
EncodeBase64Url(std::span<const std::byte> src);

/**
 * Encode with the standard alphabet and padding (for "x5c").
 */
std::string
EncodeBase64(std::span<const std::byte> src);

/**
 * Throws std::invalid_argument on error.
 */
std::vector<std::byte>
DecodeBase64Url(std::string_view src);

/**
 * Like DecodeBase64Url(), but for private key material.
 */
SecretBuffer
DecodeBase64UrlSecret(std::string_view src);

/**
 * Decode the standard alphabet with padding.  Throws
 * std::invalid_argument on error.
 */
std::vector<std::byte>
DecodeBase64(std::string_view src);

[[gnu::pure]]
bool
IsBase64UrlString(std::string_view s) noexcept;

} // namespace Avain
