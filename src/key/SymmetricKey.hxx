// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/SecretBuffer.hxx"

namespace Avain {

/**
 * A shared secret ("oct" key).
 */
struct SymmetricKey {
	SecretBuffer secret;

	bool operator==(const SymmetricKey &) const noexcept = default;
};

} // namespace Avain
