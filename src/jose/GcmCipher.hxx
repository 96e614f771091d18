// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ContentCipher.hxx"

#include <openssl/evp.h>

namespace Avain {

/**
 * AES in Galois/Counter Mode ("A128GCM", "A192GCM", "A256GCM").
 */
class GcmCipher final : public ContentCipher {
	const EVP_CIPHER &cipher;

public:
	static constexpr std::size_t IV_SIZE = 12;
	static constexpr std::size_t TAG_SIZE = 16;

	GcmCipher(const EVP_CIPHER &_cipher, std::size_t _key_size) noexcept
		:ContentCipher(_key_size, IV_SIZE), cipher(_cipher) {}

	std::vector<std::byte> Encrypt(std::span<const std::byte> cek,
				       std::span<const std::byte> iv,
				       std::span<const std::byte> aad,
				       std::span<const std::byte> plaintext,
				       std::vector<std::byte> &ciphertext) const override;

	SecretBuffer Decrypt(std::span<const std::byte> cek,
			     std::span<const std::byte> iv,
			     std::span<const std::byte> aad,
			     std::span<const std::byte> ciphertext,
			     std::span<const std::byte> tag) const override;
};

} // namespace Avain
