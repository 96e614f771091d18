// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace Avain {

struct Context;

enum class KeyFormat {
	/**
	 * A JSON Web Key.
	 */
	SINGLE_KEY,

	/**
	 * A JSON Web Key Set.
	 */
	KEY_SET,

	/**
	 * A JSON Web Encryption container (compact or JSON
	 * serialization).
	 */
	ENCRYPTED_CONTAINER,

	/**
	 * PEM.
	 */
	TEXTUAL_CONTAINER,

	/**
	 * Raw bytes used as shared secret.
	 */
	RAW_SECRET,
};

[[gnu::const]]
std::string_view
ToString(KeyFormat format) noexcept;

/**
 * Determine the format of the given data.  The first matching rule
 * wins: encrypted container, key set, single key, PEM, and finally
 * raw secret (only if the context has an explicit symmetric
 * algorithm).
 *
 * Throws #ClassificationError if no rule matches.
 */
KeyFormat
Classify(std::span<const std::byte> data, const Context &ctx);

} // namespace Avain
