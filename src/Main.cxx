// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Options.hxx"
#include "Resolve.hxx"
#include "Source.hxx"
#include "Logger.hxx"
#include "key/Thumbprint.hxx"
#include "jose/Jwk.hxx"

#include <fmt/core.h>

#include <nlohmann/json.hpp>

#include <vector>

#include <stdlib.h>

using namespace Avain;

static Context
MakeContext(const CommandLine &cmdline)
{
	std::vector<Option> options;

	if (cmdline.password_file != nullptr)
		options.emplace_back(WithPasswordFile(cmdline.password_file));

	if (cmdline.alg != nullptr)
		options.emplace_back(WithAlg(cmdline.alg));

	if (cmdline.use != nullptr)
		options.emplace_back(WithUse(cmdline.use));

	if (cmdline.kid != nullptr)
		options.emplace_back(WithKid(cmdline.kid));

	options.emplace_back(WithSubtle(cmdline.subtle));
	options.emplace_back(WithNoDefaults(cmdline.no_defaults));
	options.emplace_back(WithVerifyKid(cmdline.verify_kid));

	return Context::Build(options);
}

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);
	SetLogLevel(cmdline.verbose);

	const auto ctx = MakeContext(cmdline);
	const auto source = KeySource::FromString(cmdline.source);

	const auto jwk = cmdline.key_set
		? ResolveKeySet(source, ctx)
		: ResolveKey(source, ctx);

	if (cmdline.thumbprint)
		fmt::print("{}\n", ThumbprintString(jwk.key));
	else
		fmt::print("{}\n", EncodeJwk(jwk, cmdline.include_private).dump(2));

	return EXIT_SUCCESS;
} catch (...) {
	Logger{}(1, std::current_exception());
	return EXIT_FAILURE;
}
