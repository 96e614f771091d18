// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DeserializeEC.hxx"
#include "DeserializeBN.hxx"
#include "Error.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_*
#include <openssl/param_build.h>

#include <string>

namespace Avain {

static UniqueOSSL_PARAM
ToParam(std::string_view curve_name,
	std::span<const std::byte> q, const BIGNUM *d)
{
	const UniqueOSSL_PARAM_BLD bld{OSSL_PARAM_BLD_new()};
	if (!bld)
		throw SslError{};

	/* the builder keeps a pointer to the string, it must be
	   null-terminated and live until OSSL_PARAM_BLD_to_param() */
	const std::string curve{curve_name};

	if (!OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME,
					     curve.c_str(), curve.size()) ||
	    !OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
					      q.data(), q.size()))
		throw SslError{};

	if (d != nullptr && !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, d))
		throw SslError{};

	UniqueOSSL_PARAM param{OSSL_PARAM_BLD_to_param(bld.get())};
	if (!param)
		throw SslError{};

	return param;
}

static UniqueEVP_PKEY
FromParam(const OSSL_PARAM *param, int selection)
{
	const UniqueEVP_PKEY_CTX ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr)};
	if (!ctx)
		throw SslError{"EVP_PKEY_CTX_new_id() failed"};

	if (EVP_PKEY_fromdata_init(ctx.get()) != 1)
		throw SslError{"EVP_PKEY_fromdata_init() failed"};

	EVP_PKEY *pkey = nullptr;
	if (EVP_PKEY_fromdata(ctx.get(), &pkey, selection,
			      const_cast<OSSL_PARAM *>(param)) != 1)
		throw SslError{"EVP_PKEY_fromdata() failed"};

	return UniqueEVP_PKEY{pkey};
}

UniqueEVP_PKEY
DeserializeECPublic(std::string_view curve_name, std::span<const std::byte> q)
{
	const auto param = ToParam(curve_name, q, nullptr);
	return FromParam(param.get(), EVP_PKEY_PUBLIC_KEY);
}

UniqueEVP_PKEY
DeserializeEC(std::string_view curve_name, std::span<const std::byte> q,
	      std::span<const std::byte> d)
{
	const auto param = ToParam(curve_name, q, DeserializeBIGNUM(d).get());
	return FromParam(param.get(), EVP_PKEY_KEYPAIR);
}

} // namespace Avain
