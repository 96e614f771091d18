// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

namespace Avain {

/**
 * Initialize libsodium if that has not been done already.  Must be
 * called before using its random number generator or any of its
 * key derivation functions.
 *
 * Throws on error.
 */
void
EnsureSodium();

} // namespace Avain
