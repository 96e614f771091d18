// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"

#include <cstddef>
#include <span>

namespace Avain {

/**
 * The private components of a RSA key as big-endian integers.  The
 * CRT components are optional; either all of them or none must be
 * present.
 */
struct RsaPrivateComponents {
	std::span<const std::byte> d;
	std::span<const std::byte> p, q, dp, dq, qi;

	bool HasCRT() const noexcept {
		return !p.empty();
	}
};

UniqueEVP_PKEY
DeserializeRSAPublic(std::span<const std::byte> n,
		     std::span<const std::byte> e);

UniqueEVP_PKEY
DeserializeRSA(std::span<const std::byte> n,
	       std::span<const std::byte> e,
	       const RsaPrivateComponents &priv);

/**
 * Construct a RSA private key from the components stored in an
 * OpenSSH private key (which lacks the CRT exponents).
 */
UniqueEVP_PKEY
DeserializeRSA(std::span<const std::byte> n,
	       std::span<const std::byte> e,
	       std::span<const std::byte> d,
	       std::span<const std::byte> iqmp,
	       std::span<const std::byte> p,
	       std::span<const std::byte> q);

} // namespace Avain
