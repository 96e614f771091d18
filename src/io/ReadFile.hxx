// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/SecretBuffer.hxx"

#include <cstddef>

namespace Avain {

/**
 * The largest file accepted by ReadFile().
 */
constexpr std::size_t MAX_KEY_FILE_SIZE = 1024 * 1024;

/**
 * Read a whole file into a buffer which is wiped after use.
 *
 * Throws std::system_error on I/O errors and std::runtime_error if
 * the file is larger than #max_size.
 */
SecretBuffer
ReadFile(const char *path, std::size_t max_size=MAX_KEY_FILE_SIZE);

} // namespace Avain
