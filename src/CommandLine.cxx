// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "config.h"

#include <fmt/core.h>

#include <stdexcept>

#include <getopt.h>
#include <stdlib.h>

enum {
	OPTION_PASSWORD_FILE = 0x100,
	OPTION_SUBTLE,
	OPTION_NO_DEFAULTS,
	OPTION_VERIFY_KID,
	OPTION_SET,
	OPTION_PRIVATE,
	OPTION_THUMBPRINT,
	OPTION_VERSION,
};

static constexpr struct option long_options[] = {
	{"password-file", required_argument, nullptr, OPTION_PASSWORD_FILE},
	{"alg", required_argument, nullptr, 'a'},
	{"use", required_argument, nullptr, 'u'},
	{"kid", required_argument, nullptr, 'k'},
	{"subtle", no_argument, nullptr, OPTION_SUBTLE},
	{"no-defaults", no_argument, nullptr, OPTION_NO_DEFAULTS},
	{"verify-kid", no_argument, nullptr, OPTION_VERIFY_KID},
	{"set", no_argument, nullptr, OPTION_SET},
	{"private", no_argument, nullptr, OPTION_PRIVATE},
	{"thumbprint", no_argument, nullptr, OPTION_THUMBPRINT},
	{"verbose", no_argument, nullptr, 'v'},
	{"version", no_argument, nullptr, OPTION_VERSION},
	{"help", no_argument, nullptr, 'h'},
	{},
};

static void
PrintUsage(const char *argv0)
{
	fmt::print("usage: {} [OPTIONS] FILE|URL\n"
		   "\n"
		   "options:\n"
		   "  --password-file PATH  read the password from this file\n"
		   "  -a, --alg ALG         set the algorithm\n"
		   "  -u, --use USE         set the key use (\"sig\" or \"enc\")\n"
		   "  -k, --kid KID         set the key id or select it from a set\n"
		   "  --subtle              skip the consistency checks\n"
		   "  --no-defaults         do not infer algorithm and key id\n"
		   "  --verify-kid          require the key id to be the thumbprint\n"
		   "  --set                 the source is a key set\n"
		   "  --private             print the private members\n"
		   "  --thumbprint          print only the thumbprint\n"
		   "  -v, --verbose         more log output\n"
		   "  --version             print the version\n",
		   argv0);
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;

	while (true) {
		int option = getopt_long(argc, argv, "a:u:k:vh",
					 long_options, nullptr);
		if (option == -1)
			break;

		switch (option) {
		case OPTION_PASSWORD_FILE:
			cmdline.password_file = optarg;
			break;

		case 'a':
			cmdline.alg = optarg;
			break;

		case 'u':
			cmdline.use = optarg;
			break;

		case 'k':
			cmdline.kid = optarg;
			break;

		case OPTION_SUBTLE:
			cmdline.subtle = true;
			break;

		case OPTION_NO_DEFAULTS:
			cmdline.no_defaults = true;
			break;

		case OPTION_VERIFY_KID:
			cmdline.verify_kid = true;
			break;

		case OPTION_SET:
			cmdline.key_set = true;
			break;

		case OPTION_PRIVATE:
			cmdline.include_private = true;
			break;

		case OPTION_THUMBPRINT:
			cmdline.thumbprint = true;
			break;

		case 'v':
			++cmdline.verbose;
			break;

		case OPTION_VERSION:
			fmt::print("avain-resolve " AVAIN_VERSION "\n");
			exit(EXIT_SUCCESS);

		case 'h':
			PrintUsage(argv[0]);
			exit(EXIT_SUCCESS);

		default:
			throw std::runtime_error{"Invalid command line"};
		}
	}

	if (optind + 1 != argc)
		throw std::runtime_error{fmt::format("Usage: {} [OPTIONS] FILE|URL", argv[0])};

	cmdline.source = argv[optind];
	return cmdline;
}
