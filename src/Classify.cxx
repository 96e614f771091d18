// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Classify.hxx"
#include "Options.hxx"
#include "Error.hxx"
#include "jose/Base64.hxx"
#include "util/ByteSpan.hxx"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <vector>

using std::string_view_literals::operator""sv;

namespace Avain {

std::string_view
ToString(KeyFormat format) noexcept
{
	switch (format) {
	case KeyFormat::SINGLE_KEY:
		return "key"sv;

	case KeyFormat::KEY_SET:
		return "key set"sv;

	case KeyFormat::ENCRYPTED_CONTAINER:
		return "encrypted container"sv;

	case KeyFormat::TEXTUAL_CONTAINER:
		return "PEM"sv;

	case KeyFormat::RAW_SECRET:
		return "raw secret"sv;
	}

	return {};
}

static constexpr auto whitespace = " \t\r\n"sv;

[[gnu::pure]]
static std::string_view
StripLeft(std::string_view s) noexcept
{
	const auto i = s.find_first_not_of(whitespace);
	return i == s.npos ? std::string_view{} : s.substr(i);
}

[[gnu::pure]]
static std::string_view
StripRight(std::string_view s) noexcept
{
	const auto i = s.find_last_not_of(whitespace);
	return i == s.npos ? std::string_view{} : s.substr(0, i + 1);
}

/**
 * Is this the compact serialization of a JWE: five base64url parts
 * where the first one is a JSON object containing "enc"?
 */
static bool
IsCompactJwe(std::string_view s)
{
	if (std::count(s.begin(), s.end(), '.') != 4)
		return false;

	const auto header_b64 = s.substr(0, s.find('.'));
	if (header_b64.empty() || !IsBase64UrlString(header_b64))
		return false;

	std::vector<std::byte> header_json;
	try {
		header_json = DecodeBase64Url(header_b64);
	} catch (const std::invalid_argument &) {
		return false;
	}

	const auto header = nlohmann::json::parse(ToStringView(header_json),
						  nullptr, false);
	return header.is_object() && header.contains("enc");
}

KeyFormat
Classify(std::span<const std::byte> data, const Context &ctx)
{
	const auto s = StripRight(StripLeft(ToStringView(data)));

	if (s.starts_with('{')) {
		const auto j = nlohmann::json::parse(s, nullptr, false);
		if (j.is_object()) {
			if (j.contains("protected") && j.contains("ciphertext"))
				return KeyFormat::ENCRYPTED_CONTAINER;

			if (const auto keys = j.find("keys");
			    keys != j.end() && keys->is_array())
				return KeyFormat::KEY_SET;

			if (j.contains("kty"))
				return KeyFormat::SINGLE_KEY;
		}
	} else if (IsCompactJwe(s))
		return KeyFormat::ENCRYPTED_CONTAINER;

	if (s.starts_with("-----BEGIN "sv))
		return KeyFormat::TEXTUAL_CONTAINER;

	if (ctx.HasSymmetricAlgorithm())
		return KeyFormat::RAW_SECRET;

	throw ClassificationError{"cannot determine key type"};
}

} // namespace Avain
