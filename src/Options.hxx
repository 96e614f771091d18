// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Password.hxx"
#include "util/SecretBuffer.hxx"

#include <functional>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace Avain {

class HttpClient;

/**
 * The configuration of one resolution call.  It is built from a list
 * of #Option instances by Context::Build() and not modified
 * afterwards.
 */
struct Context {
	enum class PasswordSource {
		/**
		 * No explicit source; the prompter is used.
		 */
		NONE,

		LITERAL,
		FILE,
		PROMPTER,
	};

	PasswordSource password_source = PasswordSource::NONE;

	/**
	 * The password for #PasswordSource::LITERAL.
	 */
	SecretBuffer password;

	/**
	 * The path for #PasswordSource::FILE.
	 */
	std::string password_file;

	/**
	 * Used if #password_source is #PasswordSource::PROMPTER or
	 * #PasswordSource::NONE.
	 */
	PasswordPrompter prompter = PromptPasswordFromTerminal;

	/**
	 * The prompt text; if empty, a default text naming the
	 * source is used.
	 */
	std::string prompt;

	/**
	 * Explicit overrides for the record's "alg", "use" and
	 * "kid"; empty means not set.
	 */
	std::string alg, use, kid;

	/**
	 * Skip the algorithm/family validity and key id consistency
	 * checks.
	 */
	bool subtle = false;

	/**
	 * Do not infer the algorithm and do not default the key id.
	 */
	bool no_defaults = false;

	/**
	 * Verify that the key id of a private key is its thumbprint.
	 */
	bool verify_kid = false;

	/**
	 * The client for "https://" sources; if nullptr, a
	 * #CurlHttpClient with default settings is used.
	 */
	std::shared_ptr<HttpClient> http_client;

	/**
	 * Does the context carry an explicit symmetric algorithm, which
	 * allows treating raw bytes as a shared secret?
	 */
	[[gnu::pure]]
	bool HasSymmetricAlgorithm() const noexcept;

	static Context Build(std::span<const std::function<void(Context &)>> options);
	static Context Build(std::initializer_list<std::function<void(Context &)>> options);
};

/**
 * A named configuration step.  Options are applied in order; two
 * password sources throw #ConfigurationError.
 */
using Option = std::function<void(Context &)>;

Option
WithPassword(std::string_view password);

Option
WithPassword(std::span<const std::byte> password);

Option
WithPasswordFile(std::string_view path);

/**
 * @param prompt the prompt text; if empty, a default text naming
 * the source is used
 */
Option
WithPasswordPrompter(std::string_view prompt, PasswordPrompter prompter);

Option
WithAlg(std::string_view alg);

Option
WithUse(std::string_view use);

Option
WithKid(std::string_view kid);

Option
WithSubtle(bool subtle=true);

Option
WithNoDefaults(bool no_defaults=true);

Option
WithVerifyKid(bool verify_kid=true);

Option
WithHttpClient(std::shared_ptr<HttpClient> client);

} // namespace Avain
