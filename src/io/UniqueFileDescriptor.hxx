// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace Avain {

/**
 * Owns a file descriptor and closes it in the destructor.
 */
class UniqueFileDescriptor {
	int fd = -1;

public:
	UniqueFileDescriptor() noexcept = default;

	explicit UniqueFileDescriptor(int _fd) noexcept
		:fd(_fd) {}

	UniqueFileDescriptor(UniqueFileDescriptor &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFileDescriptor() noexcept {
		if (fd >= 0)
			close(fd);
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int Get() const noexcept {
		return fd;
	}

	/**
	 * Open a file read-only.  Returns false on error (with errno
	 * set).
	 */
	bool OpenReadOnly(const char *path) noexcept {
		fd = open(path, O_RDONLY|O_NOCTTY|O_CLOEXEC);
		return IsDefined();
	}

	ssize_t Read(std::span<std::byte> dest) const noexcept {
		return read(fd, dest.data(), dest.size());
	}

	ssize_t Write(std::span<const std::byte> src) const noexcept {
		return write(fd, src.data(), src.size());
	}
};

} // namespace Avain
