// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Resolve.hxx"
#include "Source.hxx"
#include "Decrypt.hxx"
#include "Options.hxx"
#include "Password.hxx"
#include "Error.hxx"
#include "Logger.hxx"
#include "key/Normalize.hxx"
#include "key/Thumbprint.hxx"
#include "jose/Jwk.hxx"
#include "pem/Decode.hxx"
#include "util/ByteSpan.hxx"

#include <fmt/core.h>

#include <nlohmann/json.hpp>

#include <sodium/utils.h>

using std::string_view_literals::operator""sv;

namespace Avain {

static const Logger logger{"resolve"};

static nlohmann::json
ParseJson(std::span<const std::byte> data, std::string_view source)
{
	try {
		return nlohmann::json::parse(ToStringView(data));
	} catch (const nlohmann::json::exception &) {
		std::throw_with_nested(ClassificationError{fmt::format("malformed JSON in {}", source),
							   source});
	}
}

static JsonWebKey
DecodeSingleKey(std::span<const std::byte> data, std::string_view source)
{
	const auto j = ParseJson(data, source);

	try {
		return DecodeJwk(j);
	} catch (const std::exception &) {
		std::throw_with_nested(ValidationError{fmt::format("invalid key in {}", source),
						       source});
	}
}

static KeySet
DecodeKeySet(std::span<const std::byte> data, std::string_view source)
{
	const auto j = ParseJson(data, source);

	try {
		return DecodeJwkSet(j);
	} catch (const std::exception &) {
		std::throw_with_nested(ValidationError{fmt::format("invalid key set in {}", source),
						       source});
	}
}

static JsonWebKey
DecodeTextual(std::span<const std::byte> data, const Context &ctx,
	      std::string_view source)
{
	try {
		return DecodePem(data, [&ctx, source]{
			return AcquirePassword(ctx, source);
		});
	} catch (const AuthenticationFailure &) {
		std::throw_with_nested(AuthenticationFailure{fmt::format("cannot decrypt {}", source),
							     source});
	} catch (const Error &) {
		throw;
	} catch (const std::exception &) {
		std::throw_with_nested(ValidationError{fmt::format("invalid PEM data in {}", source),
						       source});
	}
}

/**
 * Check the key id against the thumbprint if the context asks for
 * it.  A key id passed explicitly by the caller is trusted.
 */
static void
MaybeVerifyKeyId(const JsonWebKey &jwk, const Context &ctx,
		 std::string_view source)
{
	if (!ctx.verify_kid || !ctx.kid.empty())
		return;

	try {
		VerifyKeyId(jwk);
	} catch (const ValidationError &) {
		std::throw_with_nested(ValidationError{fmt::format("invalid key id in {}", source),
						       source, jwk.key_id});
	}
}

static JsonWebKey
SelectFromSet(std::span<const std::byte> data, const Context &ctx,
	      std::string_view source)
{
	auto jwk = SelectKey(DecodeKeySet(data, source), ctx, source);
	Normalize(jwk, ctx, KeyOrigin::JWK, source);
	return jwk;
}

static JsonWebKey
ResolvePayload(UnwrappedPayload &&payload, const Context &ctx,
	       std::string_view source)
{
	logger.Fmt(3, "{} contains a {}", source, ToString(payload.format));

	switch (payload.format) {
	case KeyFormat::SINGLE_KEY:
		{
			auto jwk = DecodeSingleKey(payload.data, source);
			Normalize(jwk, ctx, KeyOrigin::JWK, source);
			return jwk;
		}

	case KeyFormat::KEY_SET:
		return SelectFromSet(payload.data, ctx, source);

	case KeyFormat::TEXTUAL_CONTAINER:
		{
			auto jwk = DecodeTextual(payload.data, ctx, source);
			Normalize(jwk, ctx, KeyOrigin::TEXTUAL, source);
			return jwk;
		}

	case KeyFormat::RAW_SECRET:
		{
			JsonWebKey jwk{SymmetricKey{std::move(payload.data)}};
			Normalize(jwk, ctx, KeyOrigin::RAW, source);
			return jwk;
		}

	case KeyFormat::ENCRYPTED_CONTAINER:
		break;
	}

	throw ClassificationError{fmt::format("cannot determine key type: {}", source),
				  source};
}

static JsonWebKey
ResolveKey(SecretBuffer &&data, const Context &ctx, std::string_view source)
{
	auto jwk = ResolvePayload(Unwrap(std::move(data), ctx, source),
				  ctx, source);
	MaybeVerifyKeyId(jwk, ctx, source);
	return jwk;
}

/**
 * Is this a JSON object which is neither a key nor an encrypted
 * container nor a key set?  It is treated as an empty key set.
 */
static bool
IsEmptyKeySet(std::span<const std::byte> data)
{
	const auto j = nlohmann::json::parse(ToStringView(data), nullptr, false);
	return j.is_object() && !j.contains("keys") && !j.contains("kty") &&
		!j.contains("ciphertext");
}

static JsonWebKey
ResolveKeySet(SecretBuffer &&data, const Context &ctx, std::string_view source)
{
	if (IsEmptyKeySet(data))
		return SelectKey({}, ctx, source);

	auto payload = Unwrap(std::move(data), ctx, source);
	if (payload.format != KeyFormat::KEY_SET)
		throw ClassificationError{fmt::format("{} is not a key set", source),
					  source};

	auto jwk = SelectFromSet(payload.data, ctx, source);
	MaybeVerifyKeyId(jwk, ctx, source);
	return jwk;
}

JsonWebKey
ResolveKey(const KeySource &source, const Context &ctx)
{
	return ResolveKey(source.Load(ctx), ctx, source.GetName());
}

JsonWebKey
ResolveKeySet(const KeySource &source, const Context &ctx)
{
	return ResolveKeySet(source.Load(ctx), ctx, source.GetName());
}

JsonWebKey
ParseKey(std::span<const std::byte> data, const Context &ctx)
{
	return ResolveKey(SecretBuffer{data}, ctx, "memory"sv);
}

JsonWebKey
ParseKeySet(std::span<const std::byte> data, const Context &ctx)
{
	return ResolveKeySet(SecretBuffer{data}, ctx, "memory"sv);
}

Jwe
EncryptData(std::span<const std::byte> data,
	    std::span<const std::byte> password,
	    std::string_view content_type,
	    unsigned iterations)
{
	if (password.empty())
		throw ConfigurationError{"a password is required for encryption"};

	return EncryptJwe(data, password, content_type, iterations);
}

static Jwe
EncryptJson(const nlohmann::json &j, std::span<const std::byte> password,
	    std::string_view content_type, unsigned iterations)
{
	auto plaintext = j.dump();
	try {
		auto jwe = EncryptData(AsBytes(plaintext), password,
				       content_type, iterations);
		sodium_memzero(plaintext.data(), plaintext.size());
		return jwe;
	} catch (...) {
		sodium_memzero(plaintext.data(), plaintext.size());
		throw;
	}
}

Jwe
EncryptKey(const JsonWebKey &jwk, std::span<const std::byte> password,
	   unsigned iterations)
{
	return EncryptJson(EncodeJwk(jwk, true), password, "jwk+json"sv,
			   iterations);
}

Jwe
EncryptKeySet(const KeySet &set, std::span<const std::byte> password,
	      unsigned iterations)
{
	return EncryptJson(EncodeJwkSet(set, true), password,
			   "jwk-set+json"sv, iterations);
}

} // namespace Avain
