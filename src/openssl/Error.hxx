// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>
#include <string_view>

namespace Avain {

/**
 * An OpenSSL call failed.  The message contains the given text
 * followed by the contents of the OpenSSL error queue, which is
 * cleared.
 */
class SslError : public std::runtime_error {
public:
	explicit SslError(std::string_view msg={});
};

} // namespace Avain
