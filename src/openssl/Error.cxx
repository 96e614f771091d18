// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <openssl/err.h>

#include <string>

namespace Avain {

static std::string
FormatSslError(std::string_view msg)
{
	std::string result{msg};

	while (const unsigned long code = ERR_get_error()) {
		char buffer[256];
		ERR_error_string_n(code, buffer, sizeof(buffer));

		if (!result.empty())
			result.append(": ");
		result.append(buffer);
	}

	if (result.empty())
		result = "Unknown OpenSSL error";

	return result;
}

SslError::SslError(std::string_view msg)
	:std::runtime_error(FormatSslError(msg))
{
}

} // namespace Avain
