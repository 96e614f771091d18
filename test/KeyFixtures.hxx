// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Helpers which create key files in memory and on disk for the unit
 * tests.
 */

#pragma once

#include "key/Ed25519Key.hxx"
#include "openssl/Error.hxx"
#include "openssl/Unique.hxx"

#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <stdlib.h>
#include <unistd.h>

inline std::string
BioToString(BIO &bio)
{
	char *data;
	const long size = BIO_get_mem_data(&bio, &data);
	return {data, static_cast<std::size_t>(size)};
}

inline Avain::UniqueBIO
NewMemBio()
{
	Avain::UniqueBIO bio{BIO_new(BIO_s_mem())};
	if (!bio)
		throw Avain::SslError{"BIO_new() failed"};
	return bio;
}

/**
 * Write a private key as PKCS#8 PEM, encrypted if a password is
 * given.
 */
inline std::string
PrivateKeyToPem(EVP_PKEY &key, const char *password=nullptr)
{
	auto bio = NewMemBio();

	const EVP_CIPHER *cipher = password != nullptr ? EVP_aes_256_cbc() : nullptr;
	if (!PEM_write_bio_PKCS8PrivateKey(bio.get(), &key, cipher,
					   password, password != nullptr ? strlen(password) : 0,
					   nullptr, nullptr))
		throw Avain::SslError{"PEM_write_bio_PKCS8PrivateKey() failed"};

	return BioToString(*bio);
}

inline std::string
PublicKeyToPem(EVP_PKEY &key)
{
	auto bio = NewMemBio();
	if (!PEM_write_bio_PUBKEY(bio.get(), &key))
		throw Avain::SslError{"PEM_write_bio_PUBKEY() failed"};

	return BioToString(*bio);
}

inline std::string
CertificateToPem(X509 &cert)
{
	auto bio = NewMemBio();
	if (!PEM_write_bio_X509(bio.get(), &cert))
		throw Avain::SslError{"PEM_write_bio_X509() failed"};

	return BioToString(*bio);
}

/**
 * @param subject_alt_name an optional "subjectAltName" extension
 * value, e.g. "IP:127.0.0.1"
 */
inline Avain::UniqueX509
MakeSelfSignedCertificate(EVP_PKEY &key, const char *common_name="avain test",
			  const char *subject_alt_name=nullptr)
{
	Avain::UniqueX509 cert{X509_new()};
	if (!cert)
		throw Avain::SslError{"X509_new() failed"};

	X509_set_version(cert.get(), 2);
	ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
	X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
	X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);

	X509_NAME *name = X509_get_subject_name(cert.get());
	X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
				   reinterpret_cast<const unsigned char *>(common_name),
				   -1, -1, 0);
	X509_set_issuer_name(cert.get(), name);

	if (!X509_set_pubkey(cert.get(), &key))
		throw Avain::SslError{"X509_set_pubkey() failed"};

	if (subject_alt_name != nullptr) {
		X509V3_CTX v3;
		X509V3_set_ctx_nodb(&v3);
		X509V3_set_ctx(&v3, cert.get(), cert.get(), nullptr, nullptr, 0);

		const std::unique_ptr<X509_EXTENSION, decltype(&X509_EXTENSION_free)>
			ext{X509V3_EXT_conf_nid(nullptr, &v3, NID_subject_alt_name,
						subject_alt_name),
			    X509_EXTENSION_free};
		if (!ext || !X509_add_ext(cert.get(), ext.get(), -1))
			throw Avain::SslError{"Failed to add subjectAltName"};
	}

	if (!X509_sign(cert.get(), &key, EVP_sha256()))
		throw Avain::SslError{"X509_sign() failed"};

	return cert;
}

inline Avain::UniqueEVP_PKEY
ToEvpPkey(const Avain::Ed25519Key &key)
{
	Avain::UniqueEVP_PKEY pkey{
		EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
					     reinterpret_cast<const unsigned char *>(key.GetSeed().data()),
					     key.GetSeed().size()),
	};
	if (!pkey)
		throw Avain::SslError{"EVP_PKEY_new_raw_private_key() failed"};

	return pkey;
}

/**
 * A temporary file which is deleted by the destructor.
 */
class TemporaryFile {
	std::string path;

public:
	explicit TemporaryFile(std::string_view contents) {
		char buffer[] = "/tmp/avain-test-XXXXXX";
		const int fd = mkstemp(buffer);
		if (fd < 0)
			throw std::runtime_error{"mkstemp() failed"};

		path = buffer;

		const auto nbytes = write(fd, contents.data(), contents.size());
		close(fd);
		if (nbytes != static_cast<ssize_t>(contents.size())) {
			unlink(buffer);
			throw std::runtime_error{"write() failed"};
		}
	}

	~TemporaryFile() noexcept {
		unlink(path.c_str());
	}

	TemporaryFile(const TemporaryFile &) = delete;
	TemporaryFile &operator=(const TemporaryFile &) = delete;

	const std::string &GetPath() const noexcept {
		return path;
	}
};
