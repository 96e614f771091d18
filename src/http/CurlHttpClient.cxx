// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CurlHttpClient.hxx"
#include "Error.hxx"
#include "Logger.hxx"

#include <curl/curl.h>

#include <fmt/core.h>

#include <memory>
#include <mutex>

namespace Avain {

static const Logger logger{"http"};

namespace {

struct CurlEasyDelete {
	void operator()(CURL *curl) const noexcept {
		curl_easy_cleanup(curl);
	}
};

using UniqueCURL = std::unique_ptr<CURL, CurlEasyDelete>;

struct ResponseBuffer {
	std::string data;
	std::size_t max_size;
	bool overflow = false;
};

} // anonymous namespace

static void
GlobalInit()
{
	static std::once_flag once;
	std::call_once(once, []{
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
			throw NetworkError{"curl_global_init() failed"};
	});
}

static std::size_t
WriteCallback(char *ptr, std::size_t size, std::size_t nmemb, void *userdata) noexcept
{
	auto &buffer = *static_cast<ResponseBuffer *>(userdata);
	const std::size_t length = size * nmemb;

	if (buffer.data.size() + length > buffer.max_size) {
		buffer.overflow = true;
		/* returning a different size aborts the transfer */
		return 0;
	}

	try {
		buffer.data.append(ptr, length);
	} catch (const std::bad_alloc &) {
		return 0;
	}

	return length;
}

CurlHttpClient::CurlHttpClient(Options _options)
	:options(std::move(_options))
{
	GlobalInit();
}

template<typename T>
static void
SetOption(CURL *curl, CURLoption option, T value)
{
	const CURLcode code = curl_easy_setopt(curl, option, value);
	if (code != CURLE_OK)
		throw NetworkError{fmt::format("curl_easy_setopt() failed: {}",
					       curl_easy_strerror(code))};
}

HttpResponse
CurlHttpClient::Get(const std::string &url)
{
	const UniqueCURL curl{curl_easy_init()};
	if (!curl)
		throw NetworkError{"curl_easy_init() failed", url};

	ResponseBuffer buffer{{}, options.max_body_size};
	char error_buffer[CURL_ERROR_SIZE]{};

	SetOption(curl.get(), CURLOPT_URL, url.c_str());
	SetOption(curl.get(), CURLOPT_PROTOCOLS_STR, "https");
	SetOption(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "https");
	SetOption(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
	SetOption(curl.get(), CURLOPT_MAXREDIRS, 5L);
	SetOption(curl.get(), CURLOPT_NOSIGNAL, 1L);
	SetOption(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
	SetOption(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
	SetOption(curl.get(), CURLOPT_WRITEDATA, &buffer);

	if (!options.ca_file.empty())
		SetOption(curl.get(), CURLOPT_CAINFO, options.ca_file.c_str());

	if (options.timeout.count() > 0)
		SetOption(curl.get(), CURLOPT_TIMEOUT_MS,
			  static_cast<long>(options.timeout.count()));

	logger.Fmt(3, "GET {}", url);

	const CURLcode code = curl_easy_perform(curl.get());
	if (buffer.overflow)
		throw NetworkError{fmt::format("response from {} is too large", url), url};

	if (code != CURLE_OK)
		throw NetworkError{fmt::format("failed to fetch {}: {}", url,
					       error_buffer[0] != 0
					       ? error_buffer
					       : curl_easy_strerror(code)),
				   url};

	long status = 0;
	if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status) != CURLE_OK)
		throw NetworkError{fmt::format("failed to fetch {}: no response status", url),
				   url};

	logger.Fmt(3, "GET {}: status {}", url, status);

	return {static_cast<unsigned>(status), std::move(buffer.data)};
}

} // namespace Avain
