// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Thumbprint.hxx"
#include "Error.hxx"
#include "jose/Jwk.hxx"
#include "jose/Base64.hxx"
#include "util/ByteSpan.hxx"

#include <fmt/core.h>

namespace Avain {

std::vector<std::byte>
Thumbprint(const KeyMaterial &key, DigestAlgorithm a)
{
	/* nlohmann::json sorts object members and dump() emits no
	   whitespace, which is exactly the RFC 7638 canonical
	   form */
	const auto canonical = EncodeRequiredMembers(key).dump();
	return Digest(a, AsBytes(canonical));
}

std::string
ThumbprintString(const KeyMaterial &key, DigestAlgorithm a)
{
	return EncodeBase64Url(Thumbprint(key, a));
}

void
VerifyKeyId(const JsonWebKey &jwk)
{
	if (jwk.key_id.empty() || jwk.IsPublic())
		return;

	if (jwk.key_id != ThumbprintString(jwk.key))
		throw ValidationError{fmt::format("key id {} does not match the key thumbprint",
						  jwk.key_id),
				      {}, jwk.key_id};
}

} // namespace Avain
