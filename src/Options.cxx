// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Options.hxx"
#include "Error.hxx"
#include "key/Algorithm.hxx"

namespace Avain {

bool
Context::HasSymmetricAlgorithm() const noexcept
{
	return !alg.empty() && IsSymmetricAlgorithm(alg);
}

Context
Context::Build(std::span<const Option> options)
{
	Context ctx;
	for (const auto &option : options)
		option(ctx);
	return ctx;
}

Context
Context::Build(std::initializer_list<Option> options)
{
	return Build(std::span{options.begin(), options.size()});
}

static void
SetPasswordSource(Context &ctx, Context::PasswordSource source)
{
	if (ctx.password_source != Context::PasswordSource::NONE)
		throw ConfigurationError{"only one password source may be configured"};

	ctx.password_source = source;
}

Option
WithPassword(std::string_view password)
{
	return WithPassword(std::as_bytes(std::span{password.data(), password.size()}));
}

Option
WithPassword(std::span<const std::byte> password)
{
	return [password = SecretBuffer{password}](Context &ctx){
		SetPasswordSource(ctx, Context::PasswordSource::LITERAL);
		ctx.password = password;
	};
}

Option
WithPasswordFile(std::string_view path)
{
	return [path = std::string{path}](Context &ctx){
		SetPasswordSource(ctx, Context::PasswordSource::FILE);
		ctx.password_file = path;
	};
}

Option
WithPasswordPrompter(std::string_view prompt, PasswordPrompter prompter)
{
	if (!prompter)
		throw ConfigurationError{"no password prompter given"};

	return [prompt = std::string{prompt}, prompter = std::move(prompter)](Context &ctx){
		SetPasswordSource(ctx, Context::PasswordSource::PROMPTER);
		ctx.prompt = prompt;
		ctx.prompter = prompter;
	};
}

Option
WithAlg(std::string_view alg)
{
	return [alg = std::string{alg}](Context &ctx){
		ctx.alg = alg;
	};
}

Option
WithUse(std::string_view use)
{
	return [use = std::string{use}](Context &ctx){
		ctx.use = use;
	};
}

Option
WithKid(std::string_view kid)
{
	return [kid = std::string{kid}](Context &ctx){
		ctx.kid = kid;
	};
}

Option
WithSubtle(bool subtle)
{
	return [subtle](Context &ctx){
		ctx.subtle = subtle;
	};
}

Option
WithNoDefaults(bool no_defaults)
{
	return [no_defaults](Context &ctx){
		ctx.no_defaults = no_defaults;
	};
}

Option
WithVerifyKid(bool verify_kid)
{
	return [verify_kid](Context &ctx){
		ctx.verify_kid = verify_kid;
	};
}

Option
WithHttpClient(std::shared_ptr<HttpClient> client)
{
	return [client = std::move(client)](Context &ctx){
		ctx.http_client = client;
	};
}

} // namespace Avain
