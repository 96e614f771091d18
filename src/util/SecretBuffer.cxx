// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SecretBuffer.hxx"

#include <sodium/utils.h>

#include <algorithm> // for std::equal()
#include <cassert>

namespace Avain {

void
SecretBuffer::Wipe() noexcept
{
	if (!buffer.empty())
		sodium_memzero(buffer.data(), buffer.size());
}

void
SecretBuffer::Truncate(std::size_t new_size) noexcept
{
	assert(new_size <= buffer.size());

	sodium_memzero(buffer.data() + new_size, buffer.size() - new_size);
	buffer.resize(new_size);
}

bool
SecretBuffer::operator==(const SecretBuffer &other) const noexcept
{
	return std::equal(buffer.begin(), buffer.end(),
			  other.buffer.begin(), other.buffer.end());
}

} // namespace Avain
