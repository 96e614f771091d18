// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Avain {

/**
 * Base class for all errors raised while resolving a key.  Besides
 * the message, it remembers the source (file name or URL) and, if
 * one was involved, the key id.  Neither ever contains key material.
 */
class Error : public std::runtime_error {
	std::string source, key_id;

public:
	explicit Error(const std::string &_msg,
		       std::string_view _source={},
		       std::string_view _key_id={})
		:std::runtime_error(_msg),
		 source(_source), key_id(_key_id) {}

	const std::string &GetSource() const noexcept {
		return source;
	}

	const std::string &GetKeyId() const noexcept {
		return key_id;
	}
};

/**
 * Conflicting or missing options, e.g. two password sources or a key
 * set lookup without a key id.
 */
class ConfigurationError : public Error {
public:
	using Error::Error;
};

/**
 * The input does not match any of the supported key formats.
 */
class ClassificationError : public Error {
public:
	using Error::Error;
};

/**
 * Decryption failed, usually because of a wrong password.
 */
class AuthenticationFailure : public Error {
public:
	using Error::Error;
};

/**
 * No key in the set has the requested key id.
 */
class NotFoundError : public Error {
public:
	using Error::Error;
};

/**
 * More than one key in the set has the requested key id.
 */
class AmbiguousKeyError : public Error {
public:
	using Error::Error;
};

/**
 * The key is malformed, or its algorithm, key id or certificates are
 * inconsistent with the key material.
 */
class ValidationError : public Error {
public:
	using Error::Error;
};

class IOError : public Error {
public:
	using Error::Error;
};

/**
 * A remote source could not be fetched: connection or TLS failure, or
 * a non-2xx HTTP status.
 */
class NetworkError : public Error {
public:
	using Error::Error;
};

/**
 * Concatenate the messages of an exception and all exceptions nested
 * inside it.
 */
std::string
GetFullMessage(std::exception_ptr ep);

} // namespace Avain
