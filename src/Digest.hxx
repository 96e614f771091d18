// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace Avain {

enum class DigestAlgorithm {
	SHA1,
	SHA256,
	SHA384,
	SHA512,
};

static constexpr std::size_t DIGEST_MAX_SIZE = 64;

[[gnu::const]]
std::size_t
DigestSize(DigestAlgorithm a) noexcept;

std::size_t
Digest(DigestAlgorithm a, std::span<const std::byte> src,
       std::byte *dest);

std::vector<std::byte>
Digest(DigestAlgorithm a, std::span<const std::byte> src);

} // namespace Avain
