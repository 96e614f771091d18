// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ContentCipher.hxx"
#include "Digest.hxx"

#include <openssl/evp.h>

namespace Avain {

/**
 * AES in CBC mode combined with HMAC-SHA2 (RFC 7518 5.2,
 * "A128CBC-HS256", "A192CBC-HS384", "A256CBC-HS512").  The first
 * half of the content encryption key is the MAC key, the second half
 * is the AES key.
 */
class CbcHmacCipher final : public ContentCipher {
	const EVP_CIPHER &cipher;
	const DigestAlgorithm mac;

public:
	static constexpr std::size_t IV_SIZE = 16;

	CbcHmacCipher(const EVP_CIPHER &_cipher, DigestAlgorithm _mac,
		      std::size_t _key_size) noexcept
		:ContentCipher(_key_size, IV_SIZE), cipher(_cipher), mac(_mac) {}

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

private:
	std::size_t GetTagSize() const noexcept {
		return GetKeySize() / 2;
	}

	std::vector<std::byte> CalculateTag(std::span<const std::byte> mac_key,
					    std::span<const std::byte> iv,
					    std::span<const std::byte> aad,
					    std::span<const std::byte> ciphertext) const;
};

} // namespace Avain
