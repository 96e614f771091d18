// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ReadFile.hxx"
#include "UniqueFileDescriptor.hxx"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <sys/stat.h>

namespace Avain {

static std::system_error
MakeErrno(const char *msg) noexcept
{
	return std::system_error{errno, std::system_category(), msg};
}

SecretBuffer
ReadFile(const char *path, std::size_t max_size)
{
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path))
		throw MakeErrno("Failed to open file");

	struct stat st;
	if (fstat(fd.Get(), &st) < 0)
		throw MakeErrno("Failed to stat file");

	if (S_ISDIR(st.st_mode))
		throw std::runtime_error{"Is a directory"};

	if (S_ISREG(st.st_mode) && st.st_size > (off_t)max_size)
		throw std::runtime_error{"File is too large"};

	/* one extra byte to detect files which grow beyond the
	   limit (or pipes) */
	SecretBuffer buffer{max_size + 1};
	std::size_t position = 0;

	while (position < buffer.size()) {
		const auto nbytes = fd.Read(buffer.GetWritable().subspan(position));
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to read file");
		}

		if (nbytes == 0)
			break;

		position += nbytes;
	}

	if (position > max_size)
		throw std::runtime_error{"File is too large"};

	buffer.Truncate(position);
	return buffer;
}

} // namespace Avain
