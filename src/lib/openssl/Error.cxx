// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Error.hxx"

#include <openssl/err.h>

#include <string>

static std::string
ErrToString(std::string_view prefix) noexcept
{
	std::string result{prefix};

	while (const unsigned long code = ERR_get_error()) {
		char buffer[256];
		ERR_error_string_n(code, buffer, sizeof(buffer));

		if (!result.empty())
			result.append(": ");
		result.append(buffer);
	}

	return result;
}

SslError::SslError(std::string_view msg) noexcept
	:std::runtime_error(ErrToString(msg)) {}
