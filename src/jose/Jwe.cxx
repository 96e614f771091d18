// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Jwe.hxx"
#include "Base64.hxx"
#include "Pbes2.hxx"
#include "ContentCipher.hxx"
#include "GcmCipher.hxx"
#include "Error.hxx"
#include "key/Algorithm.hxx"
#include "util/ByteSpan.hxx"
#include "util/Sodium.hxx"

#include <sodium/randombytes.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

namespace Avain {

static std::vector<std::string_view>
SplitCompact(std::string_view s)
{
	std::vector<std::string_view> result;

	while (true) {
		const auto dot = s.find('.');
		if (dot == s.npos) {
			result.push_back(s);
			return result;
		}

		result.push_back(s.substr(0, dot));
		s = s.substr(dot + 1);
	}
}

static nlohmann::json
ParseHeader(std::string_view b64)
{
	const auto raw = DecodeBase64Url(b64);
	auto header = nlohmann::json::parse(ToStringView(raw), nullptr, false);
	if (header.is_discarded() || !header.is_object())
		throw std::invalid_argument{"JWE header is not a JSON object"};

	return header;
}

Jwe
Jwe::ParseCompact(std::string_view s)
{
	const auto parts = SplitCompact(s);
	if (parts.size() != 5)
		throw std::invalid_argument{"Malformed JWE compact serialization"};

	Jwe jwe;
	jwe.protected_b64 = parts[0];
	jwe.protected_header = ParseHeader(parts[0]);
	jwe.recipients.emplace_back();
	jwe.recipients.front().encrypted_key = DecodeBase64Url(parts[1]);
	jwe.iv = DecodeBase64Url(parts[2]);
	jwe.ciphertext = DecodeBase64Url(parts[3]);
	jwe.tag = DecodeBase64Url(parts[4]);
	return jwe;
}

static std::string_view
GetOptionalMember(const nlohmann::json &j, const char *name)
{
	const auto i = j.find(name);
	if (i == j.end())
		return {};

	if (!i->is_string())
		throw std::invalid_argument{"JWE member is not a string"};

	return i->get_ref<const std::string &>();
}

static nlohmann::json
GetOptionalObject(const nlohmann::json &j, const char *name)
{
	const auto i = j.find(name);
	if (i == j.end())
		return nlohmann::json::object();

	if (!i->is_object())
		throw std::invalid_argument{"JWE header is not a JSON object"};

	return *i;
}

static Jwe::Recipient
ParseRecipient(const nlohmann::json &j)
{
	if (!j.is_object())
		throw std::invalid_argument{"JWE recipient is not a JSON object"};

	Jwe::Recipient r;
	r.header = GetOptionalObject(j, "header");
	r.encrypted_key = DecodeBase64Url(GetOptionalMember(j, "encrypted_key"));
	return r;
}

Jwe
Jwe::ParseJson(const nlohmann::json &j)
{
	if (!j.is_object())
		throw std::invalid_argument{"JWE is not a JSON object"};

	Jwe jwe;
	jwe.protected_b64 = GetOptionalMember(j, "protected");
	if (jwe.protected_b64.empty())
		throw std::invalid_argument{"JWE has no protected header"};

	jwe.protected_header = ParseHeader(jwe.protected_b64);
	jwe.unprotected = GetOptionalObject(j, "unprotected");

	if (const auto i = j.find("recipients"); i != j.end()) {
		if (!i->is_array() || i->empty())
			throw std::invalid_argument{"Malformed JWE recipients"};

		if (j.contains("header") || j.contains("encrypted_key"))
			throw std::invalid_argument{"JWE mixes general and flattened serialization"};

		for (const auto &r : *i)
			jwe.recipients.emplace_back(ParseRecipient(r));
	} else
		jwe.recipients.emplace_back(ParseRecipient(j));

	const auto ciphertext = GetOptionalMember(j, "ciphertext");
	if (ciphertext.empty())
		throw std::invalid_argument{"JWE has no ciphertext"};

	jwe.ciphertext = DecodeBase64Url(ciphertext);
	jwe.iv = DecodeBase64Url(GetOptionalMember(j, "iv"));
	jwe.tag = DecodeBase64Url(GetOptionalMember(j, "tag"));
	jwe.aad_b64 = GetOptionalMember(j, "aad");
	if (!jwe.aad_b64.empty() && !IsBase64UrlString(jwe.aad_b64))
		throw std::invalid_argument{"Malformed JWE aad"};

	return jwe;
}

[[gnu::pure]]
static std::string_view
StripWhitespace(std::string_view s) noexcept
{
	constexpr auto whitespace = " \t\r\n"sv;

	const auto begin = s.find_first_not_of(whitespace);
	if (begin == s.npos)
		return {};

	const auto end = s.find_last_not_of(whitespace);
	return s.substr(begin, end + 1 - begin);
}

Jwe
Jwe::Parse(std::string_view s)
{
	s = StripWhitespace(s);

	if (s.starts_with('{')) {
		const auto j = nlohmann::json::parse(s, nullptr, false);
		if (j.is_discarded())
			throw std::invalid_argument{"Malformed JWE JSON serialization"};

		return ParseJson(j);
	}

	return ParseCompact(s);
}

std::string
Jwe::CompactSerialize() const
{
	if (recipients.size() != 1 || !recipients.front().header.empty() ||
	    !unprotected.empty() || !aad_b64.empty())
		throw std::invalid_argument{"JWE cannot be expressed in compact serialization"};

	std::string result = protected_b64;
	result.push_back('.');
	result.append(EncodeBase64Url(recipients.front().encrypted_key));
	result.push_back('.');
	result.append(EncodeBase64Url(iv));
	result.push_back('.');
	result.append(EncodeBase64Url(ciphertext));
	result.push_back('.');
	result.append(EncodeBase64Url(tag));
	return result;
}

static void
SerializeRecipient(nlohmann::json &j, const Jwe::Recipient &r)
{
	if (!r.header.empty())
		j["header"] = r.header;

	if (!r.encrypted_key.empty())
		j["encrypted_key"] = EncodeBase64Url(r.encrypted_key);
}

std::string
Jwe::FullSerialize() const
{
	nlohmann::json j = {
		{"protected", protected_b64},
		{"iv", EncodeBase64Url(iv)},
		{"ciphertext", EncodeBase64Url(ciphertext)},
		{"tag", EncodeBase64Url(tag)},
	};

	if (!unprotected.empty())
		j["unprotected"] = unprotected;

	if (!aad_b64.empty())
		j["aad"] = aad_b64;

	if (recipients.size() == 1) {
		SerializeRecipient(j, recipients.front());
	} else {
		auto &array = j["recipients"] = nlohmann::json::array();
		for (const auto &r : recipients) {
			auto o = nlohmann::json::object();
			SerializeRecipient(o, r);
			array.push_back(std::move(o));
		}
	}

	return j.dump();
}

static void
MergeHeader(nlohmann::json &dest, const nlohmann::json &src)
{
	for (const auto &[name, value] : src.items()) {
		if (dest.contains(name))
			throw std::invalid_argument{"Duplicate JWE header parameter"};

		dest[name] = value;
	}
}

nlohmann::json
Jwe::GetHeader(const Recipient &recipient) const
{
	auto header = protected_header;
	MergeHeader(header, unprotected);
	MergeHeader(header, recipient.header);
	return header;
}

static std::string_view
GetHeaderString(const nlohmann::json &header, const char *name)
{
	const auto i = header.find(name);
	if (i == header.end() || !i->is_string())
		throw std::invalid_argument{"Missing or malformed JWE header parameter"};

	return i->get_ref<const std::string &>();
}

static unsigned
GetIterationCount(const nlohmann::json &header)
{
	const auto i = header.find("p2c");
	if (i == header.end() || !i->is_number_integer())
		throw std::invalid_argument{"Missing or malformed JWE header parameter 'p2c'"};

	const auto value = i->get<long long>();
	if (value <= 0 || value > static_cast<long long>(PBES2_MAX_ITERATIONS))
		throw std::invalid_argument{"Bad PBES2 iteration count"};

	return static_cast<unsigned>(value);
}

static void
CheckHeader(const nlohmann::json &header)
{
	if (header.contains("zip"))
		throw std::invalid_argument{"Compressed JWE is not supported"};

	if (header.contains("crit"))
		throw std::invalid_argument{"Critical JWE header parameters are not supported"};
}

SecretBuffer
DecryptJwe(const Jwe &jwe, std::span<const std::byte> password)
{
	std::string aad = jwe.protected_b64;
	if (!jwe.aad_b64.empty()) {
		aad.push_back('.');
		aad.append(jwe.aad_b64);
	}

	bool found = false;

	for (const auto &r : jwe.recipients) {
		const auto header = jwe.GetHeader(r);
		CheckHeader(header);

		const auto alg = GetHeaderString(header, "alg");
		if (!ParsePbes2Algorithm(alg))
			/* not a password recipient */
			continue;

		found = true;

		const auto cipher = MakeContentCipher(GetHeaderString(header, "enc"));
		if (!cipher)
			throw std::invalid_argument{"Unsupported JWE content encryption algorithm"};

		const auto salt_input = DecodeBase64Url(GetHeaderString(header, "p2s"));
		const auto kek = DerivePbes2Key(alg, password, salt_input,
						GetIterationCount(header));

		SecretBuffer cek;
		try {
			cek = UnwrapKey(kek, r.encrypted_key);
		} catch (const AuthenticationFailure &) {
			/* wrong password for this recipient, try the
			   next one */
			continue;
		}

		if (cek.size() != cipher->GetKeySize())
			continue;

		return cipher->Decrypt(cek, jwe.iv, AsBytes(aad),
				       jwe.ciphertext, jwe.tag);
	}

	if (!found)
		throw std::invalid_argument{"JWE has no password-based recipient"};

	throw AuthenticationFailure{"Failed to decrypt the JWE key"};
}

static std::vector<std::byte>
RandomBytes(std::size_t size)
{
	std::vector<std::byte> result(size);
	randombytes_buf(result.data(), result.size());
	return result;
}

Jwe
EncryptJwe(std::span<const std::byte> plaintext,
	   std::span<const std::byte> password,
	   std::string_view content_type,
	   unsigned iterations)
{
	EnsureSodium();

	const auto salt_input = RandomBytes(16);

	Jwe jwe;
	jwe.protected_header = {
		{"alg", Algorithm::PBES2_HS256_A128KW},
		{"enc", Algorithm::A256GCM},
		{"p2c", iterations},
		{"p2s", EncodeBase64Url(salt_input)},
	};

	if (!content_type.empty())
		jwe.protected_header["cty"] = content_type;

	jwe.protected_b64 = EncodeBase64Url(AsBytes(jwe.protected_header.dump()));

	const auto kek = DerivePbes2Key(Algorithm::PBES2_HS256_A128KW, password,
					salt_input, iterations);

	const auto cipher = MakeContentCipher(Algorithm::A256GCM);

	SecretBuffer cek{cipher->GetKeySize()};
	randombytes_buf(cek.data(), cek.size());

	jwe.recipients.emplace_back();
	jwe.recipients.front().encrypted_key = WrapKey(kek, cek);

	jwe.iv = RandomBytes(cipher->GetIvSize());
	jwe.tag = cipher->Encrypt(cek, jwe.iv, AsBytes(jwe.protected_b64),
				  plaintext, jwe.ciphertext);
	return jwe;
}

} // namespace Avain
