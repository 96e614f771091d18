// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"
#include "Error.hxx"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <string>

namespace Avain {

inline std::string
GetStringParam(const EVP_PKEY &key, const char *name)
{
	std::size_t length;
	if (!EVP_PKEY_get_utf8_string_param(&key, name, nullptr, 0, &length))
		throw SslError{};

	std::string result(length + 1, '\0');

	if (!EVP_PKEY_get_utf8_string_param(&key, name, result.data(),
					    result.size(), &length))
		throw SslError{};

	result.resize(length);
	return result;
}

template<bool clear>
inline UniqueBIGNUM<clear>
GetBNParam(const EVP_PKEY &key, const char *name)
{
	BIGNUM *result = nullptr;
	if (!EVP_PKEY_get_bn_param(&key, name, &result))
		throw SslError{};

	return UniqueBIGNUM<clear>{result};
}

/**
 * Like GetBNParam(), but return nullptr if the key does not have
 * this parameter (e.g. the private exponent of a public key).
 */
template<bool clear>
inline UniqueBIGNUM<clear>
GetOptionalBNParam(const EVP_PKEY &key, const char *name) noexcept
{
	BIGNUM *result = nullptr;
	if (!EVP_PKEY_get_bn_param(&key, name, &result)) {
		ERR_clear_error();
		return nullptr;
	}

	return UniqueBIGNUM<clear>{result};
}

} // namespace Avain
