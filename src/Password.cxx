// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Password.hxx"
#include "Options.hxx"
#include "Error.hxx"
#include "io/ReadFile.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/ByteSpan.hxx"

#include <fmt/core.h>

#include <cerrno>

#include <termios.h>

namespace Avain {

/**
 * The longest password accepted from the terminal.
 */
static constexpr std::size_t MAX_PASSWORD_LENGTH = 4096;

namespace {

/**
 * Disables terminal echo and restores the old settings in the
 * destructor.
 */
class ScopeDisableEcho {
	const int fd;
	struct termios old;
	bool restore = false;

public:
	explicit ScopeDisableEcho(int _fd) noexcept
		:fd(_fd)
	{
		if (tcgetattr(fd, &old) == 0) {
			struct termios t = old;
			t.c_lflag &= ~ECHO;
			t.c_lflag |= ECHONL;
			restore = tcsetattr(fd, TCSAFLUSH, &t) == 0;
		}
	}

	~ScopeDisableEcho() noexcept {
		if (restore)
			tcsetattr(fd, TCSAFLUSH, &old);
	}

	ScopeDisableEcho(const ScopeDisableEcho &) = delete;
	ScopeDisableEcho &operator=(const ScopeDisableEcho &) = delete;
};

} // anonymous namespace

SecretBuffer
PromptPasswordFromTerminal(std::string_view prompt)
{
	UniqueFileDescriptor tty{open("/dev/tty", O_RDWR|O_NOCTTY|O_CLOEXEC)};
	if (!tty.IsDefined())
		throw IOError{"cannot open the terminal to prompt for the password"};

	const auto text = fmt::format("{}: ", prompt);
	if (tty.Write(AsBytes(text)) < 0)
		throw IOError{"cannot write to the terminal"};

	const ScopeDisableEcho disable_echo{tty.Get()};

	SecretBuffer buffer{MAX_PASSWORD_LENGTH};
	std::size_t length = 0;

	while (true) {
		std::byte ch;
		const auto nbytes = tty.Read(std::span{&ch, 1});
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw IOError{"cannot read from the terminal"};
		}

		if (nbytes == 0 || ch == std::byte{'\n'})
			break;

		if (length >= buffer.size())
			throw IOError{"password is too long"};

		buffer.data()[length++] = ch;
	}

	if (length > 0 && buffer.data()[length - 1] == std::byte{'\r'})
		--length;

	buffer.Truncate(length);
	return buffer;
}

SecretBuffer
ReadPasswordFile(const char *path)
{
	SecretBuffer buffer;

	try {
		buffer = ReadFile(path);
	} catch (const std::exception &) {
		std::throw_with_nested(IOError{fmt::format("cannot read password file {}", path),
					       path});
	}

	std::size_t length = buffer.size();
	if (length > 0 && buffer.data()[length - 1] == std::byte{'\n'}) {
		--length;
		if (length > 0 && buffer.data()[length - 1] == std::byte{'\r'})
			--length;
	}

	buffer.Truncate(length);
	return buffer;
}

SecretBuffer
AcquirePassword(const Context &ctx, std::string_view source)
{
	switch (ctx.password_source) {
	case Context::PasswordSource::LITERAL:
		return ctx.password;

	case Context::PasswordSource::FILE:
		return ReadPasswordFile(ctx.password_file.c_str());

	case Context::PasswordSource::NONE:
	case Context::PasswordSource::PROMPTER:
		break;
	}

	if (!ctx.prompter)
		throw ConfigurationError{"no password source configured", source};

	const auto prompt = ctx.prompt.empty()
		? fmt::format("Please enter the password to decrypt {}", source)
		: ctx.prompt;

	try {
		return ctx.prompter(prompt);
	} catch (const Error &) {
		throw;
	} catch (const std::exception &) {
		std::throw_with_nested(IOError{"failed to obtain the password", source});
	}
}

} // namespace Avain
