// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

namespace Avain {

struct HttpResponse {
	unsigned status;
	std::string body;

	bool IsSuccess() const noexcept {
		return status >= 200 && status < 300;
	}
};

/**
 * An abstract HTTP client which fetches remote key sources.
 */
class HttpClient {
public:
	virtual ~HttpClient() noexcept = default;

	/**
	 * Send a GET request.  Transport errors (connection, TLS,
	 * timeout) throw #NetworkError; a non-2xx status is returned
	 * to the caller.
	 */
	virtual HttpResponse Get(const std::string &url) = 0;
};

} // namespace Avain
