// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "openssl/BN.hxx"
#include "openssl/DeserializeBN.hxx"
#include "openssl/SerializeBN.hxx"
#include "openssl/Error.hxx"

#include <gtest/gtest.h>

#include <cstring>

using namespace Avain;

static auto
BN_hex2bn(const char *str)
{
	BIGNUM *bn = nullptr;
	const int result = BN_hex2bn(&bn, str);
	if (result <= 0)
		throw SslError{"BN_hex2bn() failed"};

	if (static_cast<std::size_t>(result) != strlen(str))
		throw std::invalid_argument{"BN_hex2bn() failed"};

	return UniqueBIGNUM<false>{bn};
}

TEST(SerializeBignum, Zero)
{
	const auto result = Serialize(*BN_hex2bn("0"));
	ASSERT_EQ(result.size(), 1U);
	EXPECT_EQ(result[0], std::byte{});
}

TEST(SerializeBignum, One)
{
	const auto result = Serialize(*BN_hex2bn("42"));
	ASSERT_EQ(result.size(), 1U);
	EXPECT_EQ(result[0], std::byte{0x42});
}

TEST(SerializeBignum, Odd)
{
	const auto result = Serialize(*BN_hex2bn("123"));
	ASSERT_EQ(result.size(), 2U);
	EXPECT_EQ(result[0], std::byte{0x01});
	EXPECT_EQ(result[1], std::byte{0x23});
}

TEST(SerializeBignum, HighBit)
{
	/* unlike the SSH "mpint", no null byte is inserted */
	const auto result = Serialize(*BN_hex2bn("8042"));
	ASSERT_EQ(result.size(), 2U);
	EXPECT_EQ(result[0], std::byte{0x80});
	EXPECT_EQ(result[1], std::byte{0x42});
}

TEST(SerializeBignum, LeadingZero)
{
	const auto result = Serialize(*BN_hex2bn("001234"));
	ASSERT_EQ(result.size(), 2U);
	EXPECT_EQ(result[0], std::byte{0x12});
	EXPECT_EQ(result[1], std::byte{0x34});
}

TEST(SerializeBignum, SetLeadingZero)
{
	const auto bn = BN_hex2bn("ff123456");

	/* clear all bits in the highest byte; there must not be any
	   leading zeroes in the output */
	for (int i = 24; i < 32; ++i)
		BN_clear_bit(bn.get(), i);

	const auto result = Serialize(*bn);
	ASSERT_EQ(result.size(), 3U);
	EXPECT_EQ(result[0], std::byte{0x12});
	EXPECT_EQ(result[1], std::byte{0x34});
	EXPECT_EQ(result[2], std::byte{0x56});
}

TEST(SerializeBignum, Padded)
{
	const auto result = SerializePadded(*BN_hex2bn("1234"), 4);
	ASSERT_EQ(result.size(), 4U);
	EXPECT_EQ(result[0], std::byte{});
	EXPECT_EQ(result[1], std::byte{});
	EXPECT_EQ(result[2], std::byte{0x12});
	EXPECT_EQ(result[3], std::byte{0x34});

	EXPECT_THROW(SerializePadded(*BN_hex2bn("123456"), 2), std::invalid_argument);
}

TEST(SerializeBignum, Negative)
{
	const auto bn = BN_hex2bn("42");
	BN_set_negative(bn.get(), 1);
	EXPECT_THROW(Serialize(*bn), std::invalid_argument);
}

TEST(SerializeBignum, Long)
{
	const auto result = Serialize(*BN_hex2bn("2fd887b60bc3b6790ae974473df38114b91381c641d7023655002d7083a512"));
	ASSERT_EQ(result.size(), 31U);
	EXPECT_EQ(result.front(), std::byte{0x2f});
	EXPECT_EQ(result.back(), std::byte{0x12});
}

TEST(DeserializeBignum, Mpint)
{
	const std::byte positive[] = {std::byte{0x00}, std::byte{0x80}, std::byte{0x42}};
	const auto bn = DeserializeMpint(positive);
	EXPECT_EQ(BN_cmp(bn.get(), BN_hex2bn("8042").get()), 0);

	const std::byte negative[] = {std::byte{0x80}, std::byte{0x42}};
	EXPECT_THROW(DeserializeMpint(negative), std::invalid_argument);
}

TEST(DeserializeBignum, Unsigned)
{
	const std::byte src[] = {std::byte{0x80}, std::byte{0x42}};
	const auto bn = DeserializeBIGNUM(src);
	EXPECT_EQ(BN_cmp(bn.get(), BN_hex2bn("8042").get()), 0);
}
