// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Key.hxx"

#include <string_view>
#include <vector>

namespace Avain {

struct Context;

/**
 * An ordered list of records.  Key ids are not required to be
 * unique; this is only checked by SelectKey().
 */
using KeySet = std::vector<JsonWebKey>;

/**
 * Count the records with the given key id.
 */
[[gnu::pure]]
std::size_t
CountKeyId(const KeySet &set, std::string_view kid) noexcept;

/**
 * Pick the one record whose key id is the one requested by the
 * context.
 *
 * @param source the name of the set for error messages
 *
 * Throws #ConfigurationError if the context has no key id,
 * #NotFoundError if no record matches, #AmbiguousKeyError if more
 * than one does.
 */
JsonWebKey
SelectKey(KeySet &&set, const Context &ctx, std::string_view source);

} // namespace Avain
