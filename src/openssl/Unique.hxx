// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/x509.h>

#include <memory>

namespace Avain {

struct OpenSslDelete {
	void operator()(EVP_PKEY *p) const noexcept {
		EVP_PKEY_free(p);
	}

	void operator()(EVP_PKEY_CTX *p) const noexcept {
		EVP_PKEY_CTX_free(p);
	}

	void operator()(EVP_CIPHER_CTX *p) const noexcept {
		EVP_CIPHER_CTX_free(p);
	}

	void operator()(X509 *p) const noexcept {
		X509_free(p);
	}

	void operator()(BIO *p) const noexcept {
		BIO_free(p);
	}

	void operator()(BN_CTX *p) const noexcept {
		BN_CTX_free(p);
	}

	void operator()(OSSL_PARAM_BLD *p) const noexcept {
		OSSL_PARAM_BLD_free(p);
	}

	void operator()(OSSL_PARAM *p) const noexcept {
		OSSL_PARAM_free(p);
	}
};

using UniqueEVP_PKEY = std::unique_ptr<EVP_PKEY, OpenSslDelete>;
using UniqueEVP_PKEY_CTX = std::unique_ptr<EVP_PKEY_CTX, OpenSslDelete>;
using UniqueEVP_CIPHER_CTX = std::unique_ptr<EVP_CIPHER_CTX, OpenSslDelete>;
using UniqueX509 = std::unique_ptr<X509, OpenSslDelete>;
using UniqueBIO = std::unique_ptr<BIO, OpenSslDelete>;
using UniqueBN_CTX = std::unique_ptr<BN_CTX, OpenSslDelete>;
using UniqueOSSL_PARAM_BLD = std::unique_ptr<OSSL_PARAM_BLD, OpenSslDelete>;
using UniqueOSSL_PARAM = std::unique_ptr<OSSL_PARAM, OpenSslDelete>;

/**
 * A BIGNUM owner.  If #clear is true, the value is wiped with
 * BN_clear_free(); use this for private key components.
 */
template<bool clear>
struct BignumDelete {
	void operator()(BIGNUM *bn) const noexcept {
		if constexpr (clear)
			BN_clear_free(bn);
		else
			BN_free(bn);
	}
};

template<bool clear>
using UniqueBIGNUM = std::unique_ptr<BIGNUM, BignumDelete<clear>>;

/**
 * Create another owning reference to the same object.
 */
inline UniqueEVP_PKEY
UpRef(EVP_PKEY &key) noexcept
{
	EVP_PKEY_up_ref(&key);
	return UniqueEVP_PKEY{&key};
}

inline UniqueX509
UpRef(X509 &cert) noexcept
{
	X509_up_ref(&cert);
	return UniqueX509{&cert};
}

} // namespace Avain
