// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/ByteSpan.hxx"

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>

namespace Avain {

struct MalformedSshData : std::invalid_argument {
	MalformedSshData() noexcept
		:std::invalid_argument("Malformed OpenSSH key data") {}
};

/**
 * Reads the SSH wire encoding (RFC 4251 5) used inside OpenSSH key
 * files.
 */
class SshDeserializer {
	std::span<const std::byte> src;

public:
	explicit constexpr SshDeserializer(std::span<const std::byte> _src) noexcept
		:src(_src) {}

	std::span<const std::byte> ReadN(std::size_t size) {
		if (src.size() < size)
			throw MalformedSshData{};
		auto result = src.first(size);
		src = src.subspan(size);
		return result;
	}

	uint_least32_t ReadU32() {
		const auto s = ReadN(4);
		return (static_cast<uint_least32_t>(s[0]) << 24) |
			(static_cast<uint_least32_t>(s[1]) << 16) |
			(static_cast<uint_least32_t>(s[2]) << 8) |
			static_cast<uint_least32_t>(s[3]);
	}

	std::span<const std::byte> ReadLengthEncoded() {
		return ReadN(ReadU32());
	}

	std::string_view ReadString() {
		return ToStringView(ReadLengthEncoded());
	}

	std::span<const std::byte> GetRest() const noexcept {
		return src;
	}
};

} // namespace Avain
