// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Normalize.hxx"
#include "Algorithm.hxx"
#include "Thumbprint.hxx"
#include "Key.hxx"
#include "Options.hxx"
#include "Error.hxx"

#include <fmt/core.h>

namespace Avain {

void
Normalize(JsonWebKey &jwk, const Context &ctx, KeyOrigin origin,
	  std::string_view source)
{
	if (jwk.IsSymmetric() && jwk.algorithm.empty() && ctx.alg.empty())
		throw ValidationError{"missing options: symmetric keys require an algorithm",
				      source, jwk.key_id};

	if (!ctx.use.empty())
		jwk.use = ctx.use;

	if (!ctx.kid.empty()) {
		if (!jwk.key_id.empty() && jwk.key_id != ctx.kid && !ctx.subtle)
			throw ValidationError{fmt::format("key id {} does not match the requested key id {}",
							  jwk.key_id, ctx.kid),
					      source, ctx.kid};

		jwk.key_id = ctx.kid;
	}

	if (!ctx.alg.empty())
		jwk.algorithm = ctx.alg;
	else if (jwk.algorithm.empty() && !ctx.no_defaults)
		jwk.algorithm = InferAlgorithm(jwk.key, jwk.use);

	const auto family = jwk.GetFamily();

	if (!ctx.subtle && !jwk.algorithm.empty() &&
	    !IsAlgorithmValid(family, jwk.algorithm))
		throw ValidationError{fmt::format("algorithm {} is not valid for a {} key",
						  jwk.algorithm, ToString(family)),
				      source, jwk.key_id};

	if (origin == KeyOrigin::TEXTUAL && jwk.key_id.empty() &&
	    !ctx.no_defaults && family != KeyFamily::UNKNOWN)
		jwk.key_id = ThumbprintString(jwk.key);
}

} // namespace Avain
