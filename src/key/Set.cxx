// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Set.hxx"
#include "Options.hxx"
#include "Error.hxx"
#include "Logger.hxx"

#include <fmt/core.h>

#include <algorithm>

namespace Avain {

static const Logger logger{"keyset"};

std::size_t
CountKeyId(const KeySet &set, std::string_view kid) noexcept
{
	return std::count_if(set.begin(), set.end(), [kid](const JsonWebKey &jwk){
		return jwk.key_id == kid;
	});
}

JsonWebKey
SelectKey(KeySet &&set, const Context &ctx, std::string_view source)
{
	if (ctx.kid.empty())
		throw ConfigurationError{fmt::format("a key id is required to select a key from {}",
						     source),
					 source};

	const std::string_view kid = ctx.kid;

	const auto n = CountKeyId(set, kid);
	if (n == 0)
		throw NotFoundError{fmt::format("cannot find key with kid {} on {}",
						kid, source),
				    source, kid};

	if (n > 1)
		throw AmbiguousKeyError{fmt::format("multiple keys with kid {} have been found on {}",
						    kid, source),
					source, kid};

	logger.Fmt(3, "selected key {} from {} ({} keys)", kid, source, set.size());

	auto i = std::find_if(set.begin(), set.end(), [kid](const JsonWebKey &jwk){
		return jwk.key_id == kid;
	});
	return std::move(*i);
}

} // namespace Avain
