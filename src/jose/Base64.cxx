// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Base64.hxx"
#include "util/ByteSpan.hxx"

#include <sodium/utils.h>

#include <stdexcept>

namespace Avain {

static std::string
Encode(std::span<const std::byte> src, int variant)
{
	const std::size_t size = sodium_base64_encoded_len(src.size(), variant);

	std::string result(size, '\0');
	sodium_bin2base64(result.data(), result.size(),
			  AsUnsigned(src), src.size(), variant);

	/* strip the null terminator */
	result.resize(size - 1);
	return result;
}

std::string
EncodeBase64Url(std::span<const std::byte> src)
{
	return Encode(src, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

std::string
EncodeBase64(std::span<const std::byte> src)
{
	return Encode(src, sodium_base64_VARIANT_ORIGINAL);
}

static std::size_t
Decode(std::string_view src, std::span<std::byte> dest, int variant)
{
	std::size_t length;
	const char *end;
	if (sodium_base642bin(AsUnsigned(dest), dest.size(),
			      src.data(), src.size(),
			      nullptr, &length, &end, variant) != 0 ||
	    end != src.data() + src.size())
		throw std::invalid_argument{"Malformed base64 string"};

	return length;
}

static constexpr std::size_t
MaxDecodedSize(std::size_t encoded_size) noexcept
{
	return encoded_size / 4 * 3 + 3;
}

std::vector<std::byte>
DecodeBase64Url(std::string_view src)
{
	std::vector<std::byte> result(MaxDecodedSize(src.size()));
	result.resize(Decode(src, result,
			     sodium_base64_VARIANT_URLSAFE_NO_PADDING));
	return result;
}

SecretBuffer
DecodeBase64UrlSecret(std::string_view src)
{
	SecretBuffer result{MaxDecodedSize(src.size())};
	result.Truncate(Decode(src, result.GetWritable(),
			       sodium_base64_VARIANT_URLSAFE_NO_PADDING));
	return result;
}

std::vector<std::byte>
DecodeBase64(std::string_view src)
{
	std::vector<std::byte> result(MaxDecodedSize(src.size()));
	result.resize(Decode(src, result, sodium_base64_VARIANT_ORIGINAL));
	return result;
}

static constexpr bool
IsBase64UrlChar(char ch) noexcept
{
	return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
		(ch >= '0' && ch <= '9') || ch == '-' || ch == '_';
}

bool
IsBase64UrlString(std::string_view s) noexcept
{
	for (const char ch : s)
		if (!IsBase64UrlChar(ch))
			return false;

	return true;
}

} // namespace Avain
