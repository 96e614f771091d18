// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Source.hxx"
#include "Options.hxx"
#include "Error.hxx"
#include "Logger.hxx"
#include "http/CurlHttpClient.hxx"
#include "io/ReadFile.hxx"
#include "util/ByteSpan.hxx"

#include <fmt/core.h>

#include <sodium/utils.h>

using std::string_view_literals::operator""sv;

namespace Avain {

static const Logger logger{"source"};

KeySource
KeySource::FromString(std::string_view s)
{
	if (s.starts_with("https://"sv))
		return Url(s);

	if (const auto i = s.find("://"sv); i != s.npos)
		throw ConfigurationError{fmt::format("unsupported URL scheme \"{}\"",
						     s.substr(0, i)),
					 s};

	return File(s);
}

static SecretBuffer
Fetch(const Context &ctx, const std::string &url)
{
	std::shared_ptr<HttpClient> client = ctx.http_client;
	if (!client)
		client = std::make_shared<CurlHttpClient>();

	logger.Fmt(3, "fetching {}", url);

	HttpResponse response;
	try {
		response = client->Get(url);
	} catch (const NetworkError &) {
		throw;
	} catch (const std::exception &) {
		std::throw_with_nested(NetworkError{fmt::format("cannot fetch {}", url),
						    url});
	}

	SecretBuffer result{AsBytes(response.body)};
	sodium_memzero(response.body.data(), response.body.size());

	if (!response.IsSuccess())
		throw NetworkError{fmt::format("error retrieving {}: status code {}",
					       url, response.status),
				   url};

	return result;
}

SecretBuffer
KeySource::Load(const Context &ctx) const
{
	switch (type) {
	case Type::FILE:
		try {
			return ReadFile(name.c_str());
		} catch (const std::exception &) {
			std::throw_with_nested(IOError{fmt::format("cannot read {}", name),
						       name});
		}

	case Type::URL:
		return Fetch(ctx, name);

	case Type::MEMORY:
		return data;
	}

	throw ConfigurationError{"invalid key source", name};
}

} // namespace Avain
