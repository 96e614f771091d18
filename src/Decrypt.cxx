// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Decrypt.hxx"
#include "Options.hxx"
#include "Password.hxx"
#include "Error.hxx"
#include "Logger.hxx"
#include "jose/Jwe.hxx"
#include "util/ByteSpan.hxx"

#include <fmt/core.h>

namespace Avain {

static const Logger logger{"decrypt"};

SecretBuffer
DecryptContainer(std::span<const std::byte> data, const Context &ctx,
		 std::string_view source)
{
	Jwe jwe;
	try {
		jwe = Jwe::Parse(ToStringView(data));
	} catch (const std::invalid_argument &) {
		std::throw_with_nested(ClassificationError{"malformed encrypted container",
							   source});
	}

	const auto password = AcquirePassword(ctx, source);

	try {
		return DecryptJwe(jwe, password);
	} catch (const AuthenticationFailure &) {
		std::throw_with_nested(AuthenticationFailure{fmt::format("cannot decrypt {}", source),
							     source});
	} catch (const std::invalid_argument &) {
		std::throw_with_nested(ClassificationError{"unsupported encrypted container",
							   source});
	}
}

static KeyFormat
ClassifySource(std::span<const std::byte> data, const Context &ctx,
	       std::string_view source)
{
	try {
		return Classify(data, ctx);
	} catch (const ClassificationError &e) {
		throw ClassificationError{fmt::format("{}: {}", e.what(), source),
					  source};
	}
}

UnwrappedPayload
Unwrap(SecretBuffer &&data, const Context &ctx, std::string_view source)
{
	for (unsigned pass = 0;; ++pass) {
		const auto format = ClassifySource(data, ctx, source);
		if (format != KeyFormat::ENCRYPTED_CONTAINER)
			return {std::move(data), format};

		if (pass >= max_decryption_passes)
			throw ClassificationError{fmt::format("too many nested encrypted containers in {}",
							      source),
						  source};

		logger.Fmt(3, "decrypting {} (pass {})", source, pass + 1);
		data = DecryptContainer(data, ctx, source);
	}
}

} // namespace Avain
