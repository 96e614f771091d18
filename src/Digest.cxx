// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Digest.hxx"
#include "openssl/Digest.hxx"
#include "openssl/Error.hxx"

namespace Avain {

static constexpr std::size_t digest_sizes[] = {
	20,
	32,
	48,
	64,
};

std::size_t
DigestSize(DigestAlgorithm a) noexcept
{
	return digest_sizes[static_cast<std::size_t>(a)];
}

std::size_t
Digest(DigestAlgorithm a, std::span<const std::byte> src,
       std::byte *dest)
{
	unsigned size;
	if (!EVP_Digest(src.data(), src.size(),
			reinterpret_cast<unsigned char *>(dest), &size,
			ToEvpMD(a), nullptr))
		throw SslError{"EVP_Digest() failed"};

	return size;
}

std::vector<std::byte>
Digest(DigestAlgorithm a, std::span<const std::byte> src)
{
	std::vector<std::byte> result(DigestSize(a));
	result.resize(Digest(a, src, result.data()));
	return result;
}

} // namespace Avain
