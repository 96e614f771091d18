// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SerializeBN.hxx"
#include "Error.hxx"
#include "util/ByteSpan.hxx"

#include <stdexcept>

namespace Avain {

static std::size_t
CheckedNumBytes(const BIGNUM &bn)
{
	if (BN_is_negative(&bn))
		throw std::invalid_argument{"Negative BIGNUM"};

	return BN_num_bytes(&bn);
}

std::vector<std::byte>
Serialize(const BIGNUM &bn)
{
	const std::size_t size = CheckedNumBytes(bn);
	if (size == 0)
		return {std::byte{}};

	std::vector<std::byte> result(size);
	BN_bn2bin(&bn, AsUnsigned(std::span{result}));
	return result;
}

std::vector<std::byte>
SerializePadded(const BIGNUM &bn, std::size_t size)
{
	if (CheckedNumBytes(bn) > size)
		throw std::invalid_argument{"BIGNUM too large"};

	std::vector<std::byte> result(size);
	if (BN_bn2binpad(&bn, AsUnsigned(std::span{result}), size) < 0)
		throw SslError{"BN_bn2binpad() failed"};

	return result;
}

SecretBuffer
SerializeSecret(const BIGNUM &bn)
{
	const std::size_t size = CheckedNumBytes(bn);
	if (size == 0)
		return SecretBuffer{1};

	SecretBuffer result{size};
	BN_bn2bin(&bn, AsUnsigned(result.GetWritable()));
	return result;
}

SecretBuffer
SerializeSecretPadded(const BIGNUM &bn, std::size_t size)
{
	if (CheckedNumBytes(bn) > size)
		throw std::invalid_argument{"BIGNUM too large"};

	SecretBuffer result{size};
	if (BN_bn2binpad(&bn, AsUnsigned(result.GetWritable()), size) < 0)
		throw SslError{"BN_bn2binpad() failed"};

	return result;
}

} // namespace Avain
