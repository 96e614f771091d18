// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Decode.hxx"
#include "OpenSSH.hxx"
#include "Error.hxx"
#include "openssl/Error.hxx"
#include "openssl/Unique.hxx"
#include "util/ByteSpan.hxx"

#include <openssl/decoder.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include <algorithm>
#include <climits>
#include <exception>
#include <memory>
#include <vector>

using std::string_view_literals::operator""sv;

namespace Avain {

static constexpr auto pem_begin = "-----BEGIN "sv;

/**
 * Find the first PEM block which is not "EC PARAMETERS".
 *
 * @return the input starting at the block's "-----BEGIN" line or
 * an empty string
 */
[[gnu::pure]]
static std::string_view
FindPemBlock(std::string_view src) noexcept
{
	while (true) {
		const auto i = src.find(pem_begin);
		if (i == src.npos)
			return {};

		src = src.substr(i);

		if (!src.substr(pem_begin.size()).starts_with("EC PARAMETERS-----"sv))
			return src;

		src = src.substr(pem_begin.size());
	}
}

std::string_view
GetPemLabel(std::string_view src) noexcept
{
	src = FindPemBlock(src);
	if (src.empty())
		return {};

	src = src.substr(pem_begin.size());

	const auto end = src.find("-----"sv);
	if (end == src.npos)
		return {};

	return src.substr(0, end);
}

static UniqueBIO
OpenMemBio(std::span<const std::byte> src)
{
	if (src.size() > INT_MAX)
		throw std::invalid_argument{"PEM input too large"};

	UniqueBIO bio{BIO_new_mem_buf(src.data(), static_cast<int>(src.size()))};
	if (!bio)
		throw SslError{"BIO_new_mem_buf() failed"};

	return bio;
}

static JsonWebKey
DecodeCertificateChain(std::span<const std::byte> src)
{
	auto bio = OpenMemBio(src);

	std::vector<UniqueX509> chain;
	while (UniqueX509 cert{PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)})
		chain.emplace_back(std::move(cert));

	if (chain.empty())
		throw SslError{"Failed to decode PEM certificate"};

	/* reading stops with a "no start line" error at the end of
	   the input */
	ERR_clear_error();

	UniqueEVP_PKEY key{X509_get_pubkey(chain.front().get())};
	if (!key)
		throw SslError{"Failed to get the certificate's public key"};

	JsonWebKey jwk{ToKeyMaterial(std::move(key))};
	jwk.certificates = std::move(chain);
	return jwk;
}

static JsonWebKey
DecodePublicKey(std::span<const std::byte> src)
{
	auto bio = OpenMemBio(src);

	EVP_PKEY *pkey = nullptr;
	const std::unique_ptr<OSSL_DECODER_CTX, decltype(&OSSL_DECODER_CTX_free)>
		dctx{OSSL_DECODER_CTX_new_for_pkey(&pkey, "PEM", nullptr, nullptr,
						   EVP_PKEY_PUBLIC_KEY,
						   nullptr, nullptr),
		     OSSL_DECODER_CTX_free};
	if (!dctx)
		throw SslError{"OSSL_DECODER_CTX_new_for_pkey() failed"};

	if (!OSSL_DECODER_from_bio(dctx.get(), bio.get()) || pkey == nullptr)
		throw SslError{"Failed to decode PEM public key"};

	return JsonWebKey{ToKeyMaterial(UniqueEVP_PKEY{pkey})};
}

namespace {

struct PasswordCallbackContext {
	const PemPasswordFunction &get_password;

	std::exception_ptr error;

	bool requested = false;
};

} // anonymous namespace

static int
PasswordCallback(char *buf, int size, int, void *userdata) noexcept
{
	auto &pc = *static_cast<PasswordCallbackContext *>(userdata);
	pc.requested = true;

	try {
		const auto password = pc.get_password();
		if (password.size() > static_cast<std::size_t>(size))
			throw std::invalid_argument{"Password too long"};

		std::copy(password.data(), password.data() + password.size(),
			  reinterpret_cast<std::byte *>(buf));
		return static_cast<int>(password.size());
	} catch (...) {
		/* rethrown by DecodePrivateKey() after OpenSSL
		   returns */
		pc.error = std::current_exception();
		return -1;
	}
}

static JsonWebKey
DecodePrivateKey(std::span<const std::byte> src,
		 const PemPasswordFunction &get_password)
{
	auto bio = OpenMemBio(src);

	PasswordCallbackContext pc{get_password};
	UniqueEVP_PKEY key{PEM_read_bio_PrivateKey(bio.get(), nullptr,
						   PasswordCallback, &pc)};
	if (pc.error) {
		ERR_clear_error();
		std::rethrow_exception(pc.error);
	}

	if (!key) {
		if (pc.requested) {
			ERR_clear_error();
			throw AuthenticationFailure{"cannot decrypt private key"};
		}

		throw SslError{"Failed to decode PEM private key"};
	}

	return JsonWebKey{ToKeyMaterial(std::move(key))};
}

JsonWebKey
DecodePem(std::span<const std::byte> src,
	  const PemPasswordFunction &get_password)
{
	const auto block = FindPemBlock(ToStringView(src));
	const auto label = GetPemLabel(block);
	if (label.empty())
		throw std::invalid_argument{"No PEM block found"};

	if (label == "OPENSSH PRIVATE KEY"sv)
		return JsonWebKey{DecodeOpenSshPrivateKey(block)};
	else if (label == "CERTIFICATE"sv)
		return DecodeCertificateChain(AsBytes(block));
	else if (label == "PUBLIC KEY"sv || label == "RSA PUBLIC KEY"sv)
		return DecodePublicKey(AsBytes(block));
	else
		return DecodePrivateKey(AsBytes(block), get_password);
}

} // namespace Avain
