// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "key/Algorithm.hxx"
#include "key/EcKey.hxx"
#include "key/Ed25519Key.hxx"
#include "key/EvpSigner.hxx"
#include "key/RsaKey.hxx"
#include "key/X25519Key.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;
using namespace Avain;

struct InferenceRow {
	KeyFamily family;
	std::string_view sig, enc;
};

static constexpr InferenceRow inference_table[] = {
	{KeyFamily::SYMMETRIC, "HS256"sv, "A256GCMKW"sv},
	{KeyFamily::EC_P256, "ES256"sv, "ECDH-ES"sv},
	{KeyFamily::EC_P384, "ES384"sv, "ECDH-ES"sv},
	{KeyFamily::EC_P521, "ES512"sv, "ECDH-ES"sv},
	{KeyFamily::RSA, "RS256"sv, "RSA-OAEP-256"sv},
	{KeyFamily::ED25519, "EdDSA"sv, "EdDSA"sv},
	{KeyFamily::X25519, "XEdDSA"sv, "XEdDSA"sv},
};

TEST(InferAlgorithm, Table)
{
	for (const auto &row : inference_table) {
		EXPECT_EQ(InferAlgorithm(row.family, {}), row.sig) << ToString(row.family);
		EXPECT_EQ(InferAlgorithm(row.family, "sig"sv), row.sig) << ToString(row.family);
		EXPECT_EQ(InferAlgorithm(row.family, "enc"sv), row.enc) << ToString(row.family);

		/* the inferred algorithm is always valid */
		EXPECT_TRUE(IsAlgorithmValid(row.family, row.sig));
		EXPECT_TRUE(IsAlgorithmValid(row.family, row.enc));
	}
}

TEST(InferAlgorithm, Unknown)
{
	EXPECT_EQ(InferAlgorithm(KeyFamily::UNKNOWN, {}), ""sv);
	EXPECT_EQ(InferAlgorithm(KeyFamily::UNKNOWN, "enc"sv), ""sv);
}

TEST(InferAlgorithm, PublicAndPrivate)
{
	const EcKey p384{EcKey::Generate{}, EcCurve::P384};
	EXPECT_EQ(InferAlgorithm(KeyMaterial{p384.PublicKey()}, {}), "ES384"sv);

	const KeyMaterial ec_private{EcKey{EcKey::Generate{}, EcCurve::P384}};
	EXPECT_EQ(InferAlgorithm(ec_private, "sig"sv), "ES384"sv);

	const Ed25519Key ed{Ed25519Key::Generate{}};
	EXPECT_EQ(InferAlgorithm(KeyMaterial{ed.PublicKey()}, "enc"sv), "EdDSA"sv);

	const X25519Key x{X25519Key::Generate{}};
	EXPECT_EQ(InferAlgorithm(KeyMaterial{x.PublicKey()}, {}), "XEdDSA"sv);
}

TEST(InferAlgorithm, Signer)
{
	const RsaKey rsa{RsaKey::Generate{}};
	const KeyMaterial signer{std::make_shared<const EvpSigner>(UpRef(rsa.Get()))};

	EXPECT_EQ(GetKeyFamily(signer), KeyFamily::RSA);
	EXPECT_EQ(InferAlgorithm(signer, {}), "RS256"sv);
	EXPECT_EQ(InferAlgorithm(signer, "enc"sv), "RSA-OAEP-256"sv);
}

TEST(AlgorithmValidity, Families)
{
	EXPECT_TRUE(IsAlgorithmValid(KeyFamily::SYMMETRIC, "HS512"sv));
	EXPECT_TRUE(IsAlgorithmValid(KeyFamily::SYMMETRIC, "dir"sv));
	EXPECT_FALSE(IsAlgorithmValid(KeyFamily::SYMMETRIC, "ES256"sv));

	EXPECT_TRUE(IsAlgorithmValid(KeyFamily::EC_P256, "ECDH-ES+A128KW"sv));
	EXPECT_FALSE(IsAlgorithmValid(KeyFamily::EC_P256, "ES384"sv));

	EXPECT_TRUE(IsAlgorithmValid(KeyFamily::RSA, "PS256"sv));
	EXPECT_FALSE(IsAlgorithmValid(KeyFamily::RSA, "EdDSA"sv));

	EXPECT_FALSE(IsAlgorithmValid(KeyFamily::ED25519, "FOOBAR"sv));
	EXPECT_TRUE(IsAlgorithmValid(KeyFamily::UNKNOWN, "FOOBAR"sv));
}

TEST(AlgorithmValidity, Symmetric)
{
	EXPECT_TRUE(IsSymmetricAlgorithm("HS256"sv));
	EXPECT_TRUE(IsSymmetricAlgorithm("A128KW"sv));
	EXPECT_TRUE(IsSymmetricAlgorithm("PBES2-HS256+A128KW"sv));
	EXPECT_FALSE(IsSymmetricAlgorithm("RS256"sv));
	EXPECT_FALSE(IsSymmetricAlgorithm(""sv));
}
