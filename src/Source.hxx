// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/SecretBuffer.hxx"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace Avain {

struct Context;

/**
 * Where the bytes of a key come from: a local file, a "https://" URL
 * or a buffer in memory.
 */
class KeySource {
public:
	enum class Type {
		FILE,
		URL,
		MEMORY,
	};

private:
	Type type;

	/**
	 * The path, the URL or the display name of a memory source.
	 */
	std::string name;

	SecretBuffer data;

	KeySource(Type _type, std::string_view _name) noexcept
		:type(_type), name(_name) {}

public:
	static KeySource File(std::string_view path) noexcept {
		return {Type::FILE, path};
	}

	static KeySource Url(std::string_view url) noexcept {
		return {Type::URL, url};
	}

	static KeySource Memory(std::span<const std::byte> data,
				std::string_view name="memory") {
		KeySource source{Type::MEMORY, name};
		source.data = SecretBuffer{data};
		return source;
	}

	/**
	 * Interpret a command line argument: "https://" URLs are
	 * fetched, anything else without a URL scheme is a file path.
	 *
	 * Throws #ConfigurationError for other URL schemes.
	 */
	static KeySource FromString(std::string_view s);

	Type GetType() const noexcept {
		return type;
	}

	/**
	 * The name used in error messages and password prompts.
	 */
	const std::string &GetName() const noexcept {
		return name;
	}

	/**
	 * Obtain the contents.  Throws #IOError or #NetworkError.
	 */
	SecretBuffer Load(const Context &ctx) const;
};

} // namespace Avain
