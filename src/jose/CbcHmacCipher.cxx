// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CbcHmacCipher.hxx"
#include "Error.hxx"
#include "openssl/Digest.hxx"
#include "openssl/Error.hxx"
#include "openssl/Unique.hxx"

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/params.h>

#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>

namespace Avain {

namespace {

struct MacDelete {
	void operator()(EVP_MAC *p) const noexcept {
		EVP_MAC_free(p);
	}

	void operator()(EVP_MAC_CTX *p) const noexcept {
		EVP_MAC_CTX_free(p);
	}
};

} // anonymous namespace

static void
MacUpdate(EVP_MAC_CTX &ctx, std::span<const std::byte> src)
{
	if (!EVP_MAC_update(&ctx, reinterpret_cast<const unsigned char *>(src.data()),
			    src.size()))
		throw SslError{"EVP_MAC_update() failed"};
}

std::vector<std::byte>
CbcHmacCipher::CalculateTag(std::span<const std::byte> mac_key,
			    std::span<const std::byte> iv,
			    std::span<const std::byte> aad,
			    std::span<const std::byte> ciphertext) const
{
	const std::unique_ptr<EVP_MAC, MacDelete> hmac{EVP_MAC_fetch(nullptr, "HMAC", nullptr)};
	if (!hmac)
		throw SslError{"EVP_MAC_fetch() failed"};

	const std::unique_ptr<EVP_MAC_CTX, MacDelete> ctx{EVP_MAC_CTX_new(hmac.get())};
	if (!ctx)
		throw SslError{"EVP_MAC_CTX_new() failed"};

	const OSSL_PARAM params[] = {
		OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST,
						 const_cast<char *>(EVP_MD_get0_name(ToEvpMD(mac))),
						 0),
		OSSL_PARAM_construct_end(),
	};

	if (!EVP_MAC_init(ctx.get(), reinterpret_cast<const unsigned char *>(mac_key.data()),
			  mac_key.size(), params))
		throw SslError{"EVP_MAC_init() failed"};

	/* the AAD length in bits as 64 bit big-endian integer */
	const uint_least64_t aad_bits = uint_least64_t(aad.size()) * 8;
	std::array<std::byte, 8> al;
	for (std::size_t i = 0; i < al.size(); ++i)
		al[i] = static_cast<std::byte>(aad_bits >> (56 - 8 * i));

	MacUpdate(*ctx, aad);
	MacUpdate(*ctx, iv);
	MacUpdate(*ctx, ciphertext);
	MacUpdate(*ctx, al);

	std::vector<std::byte> result(EVP_MAX_MD_SIZE);
	std::size_t length;
	if (!EVP_MAC_final(ctx.get(), reinterpret_cast<unsigned char *>(result.data()),
			   &length, result.size()))
		throw SslError{"EVP_MAC_final() failed"};

	/* truncate to the tag length */
	result.resize(GetTagSize());
	return result;
}

static UniqueEVP_CIPHER_CTX
InitCipher(const EVP_CIPHER &cipher, std::span<const std::byte> key,
	   std::span<const std::byte> iv, bool do_encrypt)
{
	if (iv.size() != CbcHmacCipher::IV_SIZE)
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
CbcHmacCipher::Encrypt(std::span<const std::byte> cek,
		       std::span<const std::byte> iv,
		       std::span<const std::byte> aad,
		       std::span<const std::byte> plaintext,
		       std::vector<std::byte> &ciphertext) const
{
	if (cek.size() != GetKeySize())
		throw std::invalid_argument{"Wrong key size"};

	const auto mac_key = cek.first(GetKeySize() / 2);
	const auto enc_key = cek.subspan(GetKeySize() / 2);

	const auto ctx = InitCipher(cipher, enc_key, iv, true);

	ciphertext.resize(plaintext.size() + IV_SIZE);

	int outl;
	if (EVP_CipherUpdate(ctx.get(),
			     reinterpret_cast<unsigned char *>(ciphertext.data()), &outl,
			     reinterpret_cast<const unsigned char *>(plaintext.data()),
			     plaintext.size()) != 1)
		throw SslError{"EVP_CipherUpdate() failed"};

	std::size_t position = outl;

	if (EVP_CipherFinal_ex(ctx.get(),
			       reinterpret_cast<unsigned char *>(ciphertext.data() + position),
			       &outl) != 1)
		throw SslError{"EVP_CipherFinal_ex() failed"};

	position += outl;
	ciphertext.resize(position);

	return CalculateTag(mac_key, iv, aad, ciphertext);
}

SecretBuffer
CbcHmacCipher::Decrypt(std::span<const std::byte> cek,
		       std::span<const std::byte> iv,
		       std::span<const std::byte> aad,
		       std::span<const std::byte> ciphertext,
		       std::span<const std::byte> tag) const
{
	if (cek.size() != GetKeySize())
		throw std::invalid_argument{"Wrong key size"};

	const auto mac_key = cek.first(GetKeySize() / 2);
	const auto enc_key = cek.subspan(GetKeySize() / 2);

	const auto expected = CalculateTag(mac_key, iv, aad, ciphertext);
	if (tag.size() != expected.size() ||
	    CRYPTO_memcmp(tag.data(), expected.data(), expected.size()) != 0)
		throw AuthenticationFailure{"Content authentication failed"};

	const auto ctx = InitCipher(cipher, enc_key, iv, false);

	SecretBuffer plaintext{ciphertext.size() + IV_SIZE};

	int outl;
	if (EVP_CipherUpdate(ctx.get(),
			     reinterpret_cast<unsigned char *>(plaintext.data()), &outl,
			     reinterpret_cast<const unsigned char *>(ciphertext.data()),
			     ciphertext.size()) != 1)
		throw SslError{"EVP_CipherUpdate() failed"};

	std::size_t position = outl;

	if (EVP_CipherFinal_ex(ctx.get(),
			       reinterpret_cast<unsigned char *>(plaintext.data() + position),
			       &outl) != 1) {
		ERR_clear_error();
		throw AuthenticationFailure{"Content decryption failed"};
	}

	position += outl;
	plaintext.Truncate(position);
	return plaintext;
}

} // namespace Avain
