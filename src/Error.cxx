// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

namespace Avain {

static void
AppendMessage(std::string &dest, const std::exception &e)
{
	if (!dest.empty())
		dest.append(": ");
	dest.append(e.what());

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		AppendMessage(dest, nested);
	} catch (...) {
		dest.append(": Unknown error");
	}
}

std::string
GetFullMessage(std::exception_ptr ep)
{
	std::string result;

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		AppendMessage(result, e);
	} catch (...) {
		result = "Unknown error";
	}

	return result;
}

} // namespace Avain
