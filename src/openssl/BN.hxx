// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"
#include "Error.hxx"

#include <cstddef>
#include <span>

namespace Avain {

template<bool clear>
inline UniqueBIGNUM<clear>
NewUniqueBIGNUM()
{
	auto *bn = ::BN_new();
	if (bn == nullptr)
		throw SslError{};

	return UniqueBIGNUM<clear>{bn};
}

template<bool clear>
inline UniqueBIGNUM<clear>
BN_bin2bn(std::span<const std::byte> src)
{
	auto bn = NewUniqueBIGNUM<clear>();
	if (::BN_bin2bn(reinterpret_cast<const unsigned char *>(src.data()),
			src.size(), bn.get()) == nullptr)
		throw SslError{};
	return bn;
}

template<bool clear>
inline UniqueBIGNUM<clear>
BN_sub(const BIGNUM &a, const BIGNUM &b)
{
	auto result = NewUniqueBIGNUM<clear>();
	if (!::BN_sub(result.get(), &a, &b))
		throw SslError{};

	return result;
}

template<bool clear>
inline UniqueBIGNUM<clear>
BN_mod_(const BIGNUM &a, const BIGNUM &m, BN_CTX &ctx)
{
	auto result = NewUniqueBIGNUM<clear>();
	if (!::BN_mod(result.get(), &a, &m, &ctx))
		throw SslError{};

	return result;
}

template<bool clear>
inline UniqueBIGNUM<clear>
BN_mod_inverse_(const BIGNUM &a, const BIGNUM &n, BN_CTX &ctx)
{
	auto result = NewUniqueBIGNUM<clear>();
	if (::BN_mod_inverse(result.get(), &a, &n, &ctx) == nullptr)
		throw SslError{};

	return result;
}

} // namespace Avain
