// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace Avain {

/**
 * An owned byte buffer for key material and passwords.  Its contents
 * are wiped with sodium_memzero() when the buffer is destroyed or
 * overwritten.  It never grows after construction, so no stale copy
 * is left behind by a reallocation.
 */
class SecretBuffer {
	std::vector<std::byte> buffer;

public:
	SecretBuffer() noexcept = default;

	explicit SecretBuffer(std::size_t size)
		:buffer(size) {}

	explicit SecretBuffer(std::span<const std::byte> src)
		:buffer(src.begin(), src.end()) {}

	explicit SecretBuffer(std::string_view src)
		:SecretBuffer(std::as_bytes(std::span{src.data(), src.size()})) {}

	SecretBuffer(const SecretBuffer &src)
		:buffer(src.buffer) {}

	SecretBuffer(SecretBuffer &&src) noexcept
		:buffer(std::move(src.buffer)) {}

	~SecretBuffer() noexcept {
		Wipe();
	}

	SecretBuffer &operator=(const SecretBuffer &src) {
		if (this != &src) {
			Wipe();
			buffer = src.buffer;
		}

		return *this;
	}

	SecretBuffer &operator=(SecretBuffer &&src) noexcept {
		if (this != &src) {
			Wipe();
			buffer = std::move(src.buffer);
		}

		return *this;
	}

	bool empty() const noexcept {
		return buffer.empty();
	}

	std::size_t size() const noexcept {
		return buffer.size();
	}

	std::byte *data() noexcept {
		return buffer.data();
	}

	const std::byte *data() const noexcept {
		return buffer.data();
	}

	operator std::span<const std::byte>() const noexcept {
		return buffer;
	}

	std::span<std::byte> GetWritable() noexcept {
		return buffer;
	}

	std::span<const std::byte> GetSpan() const noexcept {
		return buffer;
	}

	/**
	 * Shrink the buffer, wiping the bytes that are dropped.
	 */
	void Truncate(std::size_t new_size) noexcept;

	[[gnu::pure]]
	bool operator==(const SecretBuffer &other) const noexcept;

private:
	void Wipe() noexcept;
};

} // namespace Avain
