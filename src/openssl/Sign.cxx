// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Sign.hxx"
#include "Digest.hxx"
#include "Error.hxx"
#include "Unique.hxx"

#include <sodium/utils.h>

#include <stdexcept>

namespace Avain {

static std::vector<std::byte>
SignDigestOpenSSL(EVP_PKEY_CTX &ctx, std::span<const std::byte> digest)
{
	size_t length;
	if (EVP_PKEY_sign(&ctx, nullptr, &length,
			  reinterpret_cast<const unsigned char *>(digest.data()),
			  digest.size()) <= 0)
		throw SslError{"EVP_PKEY_sign() failed"};

	std::vector<std::byte> result(length);
	if (EVP_PKEY_sign(&ctx,
			  reinterpret_cast<unsigned char *>(result.data()), &length,
			  reinterpret_cast<const unsigned char *>(digest.data()),
			  digest.size()) <= 0)
		throw SslError{"EVP_PKEY_sign() failed"};

	result.resize(length);
	return result;
}

std::vector<std::byte>
SignDigest(EVP_PKEY &key, DigestAlgorithm hash_alg,
	   std::span<const std::byte> digest)
{
	const auto *const md = ToEvpMD(hash_alg);
	if (md == nullptr)
		throw std::invalid_argument{"Digest algorithm not supported by OpenSSL"};

	if (digest.size() != DigestSize(hash_alg))
		throw std::invalid_argument{"Wrong digest size"};

	const UniqueEVP_PKEY_CTX ctx(EVP_PKEY_CTX_new(&key, nullptr));
	if (!ctx)
		throw SslError("EVP_PKEY_CTX_new() failed");

	if (EVP_PKEY_sign_init(ctx.get()) <= 0)
		throw SslError("EVP_PKEY_sign_init() failed");

	if (EVP_PKEY_CTX_set_signature_md(ctx.get(), md) <= 0)
		throw SslError("EVP_PKEY_CTX_set_signature_md() failed");

	return SignDigestOpenSSL(*ctx, digest);
}

std::vector<std::byte>
SignMessage(EVP_PKEY &key, DigestAlgorithm hash_alg,
	    std::span<const std::byte> src)
{
	std::byte digest_buffer[DIGEST_MAX_SIZE];
	Digest(hash_alg, src, digest_buffer);

	try {
		auto result = SignDigest(key, hash_alg,
					 std::span{digest_buffer, DigestSize(hash_alg)});
		sodium_memzero(digest_buffer, sizeof(digest_buffer));
		return result;
	} catch (...) {
		sodium_memzero(digest_buffer, sizeof(digest_buffer));
		throw;
	}
}

} // namespace Avain
