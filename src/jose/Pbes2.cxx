// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Pbes2.hxx"
#include "Error.hxx"
#include "key/Algorithm.hxx"
#include "openssl/Digest.hxx"
#include "openssl/Error.hxx"
#include "openssl/Unique.hxx"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace Avain {

std::optional<Pbes2Algorithm>
ParsePbes2Algorithm(std::string_view alg) noexcept
{
	if (alg == Algorithm::PBES2_HS256_A128KW)
		return Pbes2Algorithm{DigestAlgorithm::SHA256, 16};
	else if (alg == Algorithm::PBES2_HS384_A192KW)
		return Pbes2Algorithm{DigestAlgorithm::SHA384, 24};
	else if (alg == Algorithm::PBES2_HS512_A256KW)
		return Pbes2Algorithm{DigestAlgorithm::SHA512, 32};
	else
		return std::nullopt;
}

SecretBuffer
DerivePbes2Key(std::string_view alg, std::span<const std::byte> password,
	       std::span<const std::byte> salt_input, unsigned iterations)
{
	const auto a = ParsePbes2Algorithm(alg);
	if (!a)
		throw std::invalid_argument{"Unsupported key management algorithm"};

	if (iterations == 0 || iterations > PBES2_MAX_ITERATIONS)
		throw std::invalid_argument{"Bad PBES2 iteration count"};

	if (salt_input.size() < PBES2_MIN_SALT_SIZE)
		throw std::invalid_argument{"PBES2 salt is too short"};

	std::vector<std::byte> salt;
	salt.reserve(alg.size() + 1 + salt_input.size());
	for (const char ch : alg)
		salt.push_back(static_cast<std::byte>(ch));
	salt.push_back(std::byte{0});
	salt.insert(salt.end(), salt_input.begin(), salt_input.end());

	SecretBuffer kek{a->key_size};
	if (PKCS5_PBKDF2_HMAC(reinterpret_cast<const char *>(password.data()),
			      password.size(),
			      reinterpret_cast<const unsigned char *>(salt.data()),
			      salt.size(),
			      iterations, ToEvpMD(a->hash),
			      kek.size(),
			      reinterpret_cast<unsigned char *>(kek.data())) != 1)
		throw SslError{"PKCS5_PBKDF2_HMAC() failed"};

	return kek;
}

[[gnu::const]]
static const EVP_CIPHER *
GetWrapCipher(std::size_t kek_size) noexcept
{
	switch (kek_size) {
	case 16:
		return EVP_aes_128_wrap();

	case 24:
		return EVP_aes_192_wrap();

	case 32:
		return EVP_aes_256_wrap();

	default:
		return nullptr;
	}
}

static UniqueEVP_CIPHER_CTX
InitWrap(std::span<const std::byte> kek, bool do_encrypt)
{
	const auto *cipher = GetWrapCipher(kek.size());
	if (cipher == nullptr)
		throw std::invalid_argument{"Wrong key encryption key size"};

	UniqueEVP_CIPHER_CTX ctx{EVP_CIPHER_CTX_new()};
	if (!ctx)
		throw SslError{};

	EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);

	if (!EVP_CipherInit_ex(ctx.get(), cipher, nullptr,
			       reinterpret_cast<const unsigned char *>(kek.data()),
			       nullptr, do_encrypt))
		throw SslError{"EVP_CipherInit_ex() failed"};

	return ctx;
}

std::vector<std::byte>
WrapKey(std::span<const std::byte> kek, std::span<const std::byte> cek)
{
	if (cek.size() < 16 || cek.size() % 8 != 0)
		throw std::invalid_argument{"Bad content encryption key size"};

	const auto ctx = InitWrap(kek, true);

	std::vector<std::byte> result(cek.size() + 8);
	int outl;
	if (EVP_CipherUpdate(ctx.get(),
			     reinterpret_cast<unsigned char *>(result.data()), &outl,
			     reinterpret_cast<const unsigned char *>(cek.data()),
			     cek.size()) != 1)
		throw SslError{"AES key wrap failed"};

	result.resize(outl);
	return result;
}

SecretBuffer
UnwrapKey(std::span<const std::byte> kek, std::span<const std::byte> wrapped)
{
	if (wrapped.size() < 24 || wrapped.size() % 8 != 0)
		throw std::invalid_argument{"Bad encrypted key size"};

	const auto ctx = InitWrap(kek, false);

	SecretBuffer result{wrapped.size()};
	int outl;
	if (EVP_CipherUpdate(ctx.get(),
			     reinterpret_cast<unsigned char *>(result.data()), &outl,
			     reinterpret_cast<const unsigned char *>(wrapped.data()),
			     wrapped.size()) != 1 || outl <= 0) {
		ERR_clear_error();
		throw AuthenticationFailure{"Key unwrap failed"};
	}

	result.Truncate(outl);
	return result;
}

} // namespace Avain
