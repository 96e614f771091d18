// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/SecretBuffer.hxx"

#include <functional>
#include <string_view>

namespace Avain {

struct Context;

/**
 * A function which asks the user for a password.  It receives the
 * prompt text and throws on error.
 */
using PasswordPrompter = std::function<SecretBuffer(std::string_view prompt)>;

/**
 * Ask for a password on the controlling terminal (/dev/tty) with
 * echo disabled.  Throws #IOError if there is no terminal.
 */
SecretBuffer
PromptPasswordFromTerminal(std::string_view prompt);

/**
 * Read a password file.  A trailing newline ("\n" or "\r\n") is
 * removed.  Throws #IOError naming the file on error.
 */
SecretBuffer
ReadPasswordFile(const char *path);

/**
 * Obtain the password for decrypting the given source, using the
 * strategy configured in the context: the literal password, the
 * password file or the prompter.
 */
SecretBuffer
AcquirePassword(const Context &ctx, std::string_view source);

} // namespace Avain
