// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "openssl/Unique.hxx"
#include "openssl/DeserializeRSA.hxx"
#include "util/SecretBuffer.hxx"

#include <cstddef>
#include <span>
#include <vector>

namespace Avain {

/**
 * A RSA key, either public or private.
 */
class RsaKey {
	UniqueEVP_PKEY key;
	bool is_private;

public:
	struct Generate {};
	explicit RsaKey(Generate, unsigned bits=2048);

	/**
	 * Take ownership of an OpenSSL key.  Throws
	 * std::invalid_argument if it is not a RSA key.
	 */
	explicit RsaKey(UniqueEVP_PKEY &&_key);

	RsaKey(RsaKey &&) noexcept = default;
	RsaKey &operator=(RsaKey &&) noexcept = default;

	/**
	 * @param priv the private components or nullptr for a public
	 * key
	 */
	static RsaKey FromComponents(std::span<const std::byte> n,
				     std::span<const std::byte> e,
				     const RsaPrivateComponents *priv);

	bool IsPrivate() const noexcept {
		return is_private;
	}

	EVP_PKEY &Get() const noexcept {
		return *key;
	}

	unsigned GetBits() const noexcept;

	std::vector<std::byte> GetN() const;
	std::vector<std::byte> GetE() const;

	/**
	 * The private components.  The CRT members are empty if
	 * the key was constructed without them.
	 */
	struct PrivateParams {
		SecretBuffer d, p, q, dp, dq, qi;
	};

	PrivateParams GetPrivate() const;

	RsaKey PublicKey() const;

	[[gnu::pure]]
	bool operator==(const RsaKey &other) const noexcept;

private:
	RsaKey(UniqueEVP_PKEY &&_key, bool _is_private) noexcept
		:key(std::move(_key)), is_private(_is_private) {}
};

} // namespace Avain
