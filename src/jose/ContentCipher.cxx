// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ContentCipher.hxx"
#include "GcmCipher.hxx"
#include "CbcHmacCipher.hxx"
#include "key/Algorithm.hxx"

#include <openssl/evp.h>

namespace Avain {

std::unique_ptr<ContentCipher>
MakeContentCipher(std::string_view enc)
{
	if (enc == Algorithm::A128GCM)
		return std::make_unique<GcmCipher>(*EVP_aes_128_gcm(), 16);
	else if (enc == Algorithm::A192GCM)
		return std::make_unique<GcmCipher>(*EVP_aes_192_gcm(), 24);
	else if (enc == Algorithm::A256GCM)
		return std::make_unique<GcmCipher>(*EVP_aes_256_gcm(), 32);
	else if (enc == Algorithm::A128CBC_HS256)
		return std::make_unique<CbcHmacCipher>(*EVP_aes_128_cbc(),
						       DigestAlgorithm::SHA256, 32);
	else if (enc == Algorithm::A192CBC_HS384)
		return std::make_unique<CbcHmacCipher>(*EVP_aes_192_cbc(),
						       DigestAlgorithm::SHA384, 48);
	else if (enc == Algorithm::A256CBC_HS512)
		return std::make_unique<CbcHmacCipher>(*EVP_aes_256_cbc(),
						       DigestAlgorithm::SHA512, 64);

	return {};
}

} // namespace Avain
