// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DeserializeRSA.hxx"
#include "DeserializeBN.hxx"
#include "BN.hxx"
#include "Error.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_RSA_*
#include <openssl/param_build.h>

#include <stdexcept>

namespace Avain {

static UniqueOSSL_PARAM_BLD
NewParamBuilder()
{
	UniqueOSSL_PARAM_BLD bld{OSSL_PARAM_BLD_new()};
	if (!bld)
		throw SslError{};

	return bld;
}

static void
Push(OSSL_PARAM_BLD &bld, const char *name, const BIGNUM &value)
{
	if (!OSSL_PARAM_BLD_push_BN(&bld, name, &value))
		throw SslError{};
}

static UniqueOSSL_PARAM
ToParam(OSSL_PARAM_BLD &bld)
{
	UniqueOSSL_PARAM param{OSSL_PARAM_BLD_to_param(&bld)};
	if (!param)
		throw SslError{};

	return param;
}

static UniqueEVP_PKEY
FromParam(const OSSL_PARAM *param, int selection)
{
	const UniqueEVP_PKEY_CTX ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr)};
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
DeserializeRSAPublic(std::span<const std::byte> n,
		     std::span<const std::byte> e)
{
	const auto n_ = DeserializeBIGNUM(n), e_ = DeserializeBIGNUM(e);

	const auto bld = NewParamBuilder();
	Push(*bld, OSSL_PKEY_PARAM_RSA_N, *n_);
	Push(*bld, OSSL_PKEY_PARAM_RSA_E, *e_);

	const auto param = ToParam(*bld);
	return FromParam(param.get(), EVP_PKEY_PUBLIC_KEY);
}

static UniqueEVP_PKEY
DeserializeRSA(const BIGNUM &n, const BIGNUM &e, const BIGNUM &d,
	       const BIGNUM *p, const BIGNUM *q,
	       const BIGNUM *dp, const BIGNUM *dq, const BIGNUM *qi)
{
	const auto bld = NewParamBuilder();
	Push(*bld, OSSL_PKEY_PARAM_RSA_N, n);
	Push(*bld, OSSL_PKEY_PARAM_RSA_E, e);
	Push(*bld, OSSL_PKEY_PARAM_RSA_D, d);

	if (p != nullptr) {
		Push(*bld, OSSL_PKEY_PARAM_RSA_FACTOR1, *p);
		Push(*bld, OSSL_PKEY_PARAM_RSA_FACTOR2, *q);
		Push(*bld, OSSL_PKEY_PARAM_RSA_EXPONENT1, *dp);
		Push(*bld, OSSL_PKEY_PARAM_RSA_EXPONENT2, *dq);
		Push(*bld, OSSL_PKEY_PARAM_RSA_COEFFICIENT1, *qi);
	}

	const auto param = ToParam(*bld);
	return FromParam(param.get(), EVP_PKEY_KEYPAIR);
}

/**
 * Calculate the CRT exponent "d mod (factor - 1)".
 */
static UniqueBIGNUM<true>
CalcFactorExponent(const BIGNUM &d, const BIGNUM &factor, BN_CTX &ctx)
{
	const auto tmp = BN_sub<true>(factor, *BN_value_one());
	return BN_mod_<true>(d, *tmp, ctx);
}

static UniqueBIGNUM<true>
DeserializeOrCalc(std::span<const std::byte> src, auto &&calc)
{
	return src.empty() ? calc() : DeserializeBIGNUM(src);
}

UniqueEVP_PKEY
DeserializeRSA(std::span<const std::byte> n,
	       std::span<const std::byte> e,
	       const RsaPrivateComponents &priv)
{
	const auto n_ = DeserializeBIGNUM(n), e_ = DeserializeBIGNUM(e);
	const auto d = DeserializeBIGNUM(priv.d);

	if (!priv.HasCRT())
		return DeserializeRSA(*n_, *e_, *d,
				      nullptr, nullptr, nullptr, nullptr, nullptr);

	if (priv.q.empty())
		throw std::invalid_argument{"Incomplete RSA CRT parameters"};

	const auto p = DeserializeBIGNUM(priv.p), q = DeserializeBIGNUM(priv.q);

	const UniqueBN_CTX bn_ctx{BN_CTX_new()};
	if (!bn_ctx)
		throw SslError{};

	/* the CRT exponents and the coefficient are optional in
	   JWK; calculate the missing ones */
	const auto dp = DeserializeOrCalc(priv.dp, [&]{
		return CalcFactorExponent(*d, *p, *bn_ctx);
	});
	const auto dq = DeserializeOrCalc(priv.dq, [&]{
		return CalcFactorExponent(*d, *q, *bn_ctx);
	});
	const auto qi = DeserializeOrCalc(priv.qi, [&]{
		return BN_mod_inverse_<true>(*q, *p, *bn_ctx);
	});

	return DeserializeRSA(*n_, *e_, *d,
			      p.get(), q.get(), dp.get(), dq.get(), qi.get());
}

UniqueEVP_PKEY
DeserializeRSA(std::span<const std::byte> n,
	       std::span<const std::byte> e,
	       std::span<const std::byte> d,
	       std::span<const std::byte> iqmp,
	       std::span<const std::byte> p,
	       std::span<const std::byte> q)
{
	const auto n_ = DeserializeMpint(n), e_ = DeserializeMpint(e);
	const auto d_ = DeserializeMpint(d), iqmp_ = DeserializeMpint(iqmp);
	const auto p_ = DeserializeMpint(p), q_ = DeserializeMpint(q);

	const UniqueBN_CTX bn_ctx{BN_CTX_new()};
	if (!bn_ctx)
		throw SslError{};

	const auto dmp = CalcFactorExponent(*d_, *p_, *bn_ctx);
	const auto dmq = CalcFactorExponent(*d_, *q_, *bn_ctx);

	return DeserializeRSA(*n_, *e_, *d_,
			      p_.get(), q_.get(), dmp.get(), dmq.get(), iqmp_.get());
}

} // namespace Avain
