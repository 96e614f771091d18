// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/SecretBuffer.hxx"

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace Avain {

/**
 * An abstract interface for JWE content encryption algorithms (the
 * "enc" header parameter).  All of them are authenticated: a tag is
 * produced by Encrypt() and verified by Decrypt().
 */
class ContentCipher {
	const std::size_t key_size, iv_size;

protected:
	ContentCipher(std::size_t _key_size, std::size_t _iv_size) noexcept
		:key_size(_key_size), iv_size(_iv_size) {}

public:
	virtual ~ContentCipher() noexcept = default;

	ContentCipher(const ContentCipher &) = delete;
	ContentCipher &operator=(const ContentCipher &) = delete;

	/**
	 * The size of the content encryption key.
	 */
	std::size_t GetKeySize() const noexcept {
		return key_size;
	}

	std::size_t GetIvSize() const noexcept {
		return iv_size;
	}

	/**
	 * Encrypt the plaintext.
	 *
	 * @param ciphertext receives the encrypted data
	 * @return the authentication tag
	 */
	virtual std::vector<std::byte> Encrypt(std::span<const std::byte> cek,
					       std::span<const std::byte> iv,
					       std::span<const std::byte> aad,
					       std::span<const std::byte> plaintext,
					       std::vector<std::byte> &ciphertext) const = 0;

	/**
	 * Verify the tag and decrypt.  Throws #AuthenticationFailure
	 * if verification fails; no plaintext is returned in that
	 * case.
	 */
	virtual SecretBuffer Decrypt(std::span<const std::byte> cek,
				     std::span<const std::byte> iv,
				     std::span<const std::byte> aad,
				     std::span<const std::byte> ciphertext,
				     std::span<const std::byte> tag) const = 0;
};

/**
 * Construct a #ContentCipher for the given "enc" value.
 *
 * @return the new instance or nullptr if the algorithm is not
 * supported
 */
std::unique_ptr<ContentCipher>
MakeContentCipher(std::string_view enc);

} // namespace Avain
