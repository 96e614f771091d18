// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "GcmCipher.hxx"
#include "Error.hxx"
#include "openssl/Error.hxx"
#include "openssl/Unique.hxx"

#include <openssl/err.h>

#include <stdexcept>

namespace Avain {

static int
EVP_CipherUpdate(EVP_CIPHER_CTX &ctx, std::byte *out, int *outl,
		 std::span<const std::byte> in) noexcept
{
	return EVP_CipherUpdate(&ctx,
				reinterpret_cast<unsigned char *>(out), outl,
				reinterpret_cast<const unsigned char *>(in.data()),
				in.size());
}

static int
EVP_CipherFinal_ex(EVP_CIPHER_CTX &ctx, std::byte *out, int *outl) noexcept
{
	return EVP_CipherFinal_ex(&ctx,
				  reinterpret_cast<unsigned char *>(out), outl);
}

static UniqueEVP_CIPHER_CTX
InitCipher(const EVP_CIPHER &cipher, std::size_t key_size,
	   std::span<const std::byte> key, std::span<const std::byte> iv,
	   bool do_encrypt)
{
	if (key.size() != key_size)
		throw std::invalid_argument{"Wrong key size"};

	if (iv.size() != GcmCipher::IV_SIZE)
		throw std::invalid_argument{"Bad IV"};

	UniqueEVP_CIPHER_CTX ctx{EVP_CIPHER_CTX_new()};
	if (!ctx)
		throw SslError{};

	if (!EVP_CipherInit_ex(ctx.get(), &cipher, nullptr,
			       reinterpret_cast<const unsigned char *>(key.data()),
			       reinterpret_cast<const unsigned char *>(iv.data()),
			       do_encrypt))
		throw SslError{"EVP_CipherInit_ex() failed"};

	return ctx;
}

std::vector<std::byte>
GcmCipher::Encrypt(std::span<const std::byte> cek,
		   std::span<const std::byte> iv,
		   std::span<const std::byte> aad,
		   std::span<const std::byte> plaintext,
		   std::vector<std::byte> &ciphertext) const
{
	const auto ctx = InitCipher(cipher, GetKeySize(), cek, iv, true);

	int outl;
	if (EVP_CipherUpdate(*ctx, nullptr, &outl, aad) != 1)
		throw SslError{"EVP_CipherUpdate() failed"};

	ciphertext.resize(plaintext.size());

	std::size_t position = 0;
	if (EVP_CipherUpdate(*ctx, ciphertext.data(), &outl, plaintext) != 1)
		throw SslError{"EVP_CipherUpdate() failed"};

	position += outl;

	if (EVP_CipherFinal_ex(*ctx, ciphertext.data() + position, &outl) != 1)
		throw SslError{"EVP_CipherFinal_ex() failed"};

	position += outl;
	ciphertext.resize(position);

	std::vector<std::byte> tag(TAG_SIZE);
	if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, tag.size(),
				tag.data()) != 1)
		throw SslError{"EVP_CTRL_GCM_GET_TAG failed"};

	return tag;
}

SecretBuffer
GcmCipher::Decrypt(std::span<const std::byte> cek,
		   std::span<const std::byte> iv,
		   std::span<const std::byte> aad,
		   std::span<const std::byte> ciphertext,
		   std::span<const std::byte> tag) const
{
	if (tag.size() != TAG_SIZE)
		throw AuthenticationFailure{"Wrong authentication tag size"};

	const auto ctx = InitCipher(cipher, GetKeySize(), cek, iv, false);

	if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, tag.size(),
				const_cast<std::byte *>(tag.data())) != 1)
		throw SslError{"EVP_CTRL_GCM_SET_TAG failed"};

	int outl;
	if (EVP_CipherUpdate(*ctx, nullptr, &outl, aad) != 1)
		throw SslError{"EVP_CipherUpdate() failed"};

	SecretBuffer plaintext{ciphertext.size() + 1};

	std::size_t position = 0;
	if (EVP_CipherUpdate(*ctx, plaintext.data(), &outl, ciphertext) != 1)
		throw SslError{"EVP_CipherUpdate() failed"};

	position += outl;

	/* this verifies the tag; the plaintext is discarded (and
	   wiped) if it does not match */
	if (EVP_CipherFinal_ex(*ctx, plaintext.data() + position, &outl) != 1) {
		ERR_clear_error();
		throw AuthenticationFailure{"Content decryption failed"};
	}

	position += outl;
	plaintext.Truncate(position);
	return plaintext;
}

} // namespace Avain
