// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "HttpClient.hxx"

#include <chrono>
#include <cstddef>
#include <string>

namespace Avain {

struct CurlHttpClientOptions {
	/**
	 * A CA bundle file; if empty, the system default is
	 * used.
	 */
	std::string ca_file;

	/**
	 * The total timeout; zero means no timeout.
	 */
	std::chrono::milliseconds timeout{};

	/**
	 * Responses larger than this fail.
	 */
	std::size_t max_body_size = 1024 * 1024;
};

/**
 * A #HttpClient implementation using libcurl.  Only HTTPS is
 * allowed, also for redirects.
 */
class CurlHttpClient final : public HttpClient {
public:
	using Options = CurlHttpClientOptions;

private:
	const Options options;

public:
	explicit CurlHttpClient(Options _options={});

	HttpResponse Get(const std::string &url) override;
};

} // namespace Avain
