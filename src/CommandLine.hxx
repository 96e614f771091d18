// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct CommandLine {
	/**
	 * The key source: a file path or a "https://" URL.
	 */
	const char *source = nullptr;

	const char *password_file = nullptr;

	const char *alg = nullptr, *use = nullptr, *kid = nullptr;

	unsigned verbose = 1;

	bool subtle = false;
	bool no_defaults = false;
	bool verify_kid = false;

	/**
	 * Treat the source as a key set and select the key by its
	 * key id.
	 */
	bool key_set = false;

	/**
	 * Include the private members in the output.
	 */
	bool include_private = false;

	/**
	 * Print only the RFC 7638 thumbprint.
	 */
	bool thumbprint = false;
};

/**
 * Parse the command line.  Exits the process for "--help" and
 * "--version"; throws std::runtime_error on usage errors.
 */
CommandLine
ParseCommandLine(int argc, char **argv);
