// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Base64.hxx"

std::string
SodiumBase64(std::span<const std::byte> src, int variant)
{
	/* subtracting 1 because the macro includes space for the
	   null terminator */
	std::string result(sodium_base64_ENCODED_LEN(src.size(), variant) - 1,
			   '\0');

	/* std::string guarantees a writable null terminator after
	   size() characters */
	sodium_bin2base64(result.data(), result.size() + 1,
			  reinterpret_cast<const unsigned char *>(src.data()),
			  src.size(),
			  variant);
	return result;
}

std::optional<std::vector<std::byte>>
SodiumDecodeBase64(std::string_view src, int variant)
{
	std::vector<std::byte> buffer(src.size() / 4 * 3 + 3);

	std::size_t decoded_size;
	const char *end;
	if (sodium_base642bin(std::span{buffer}, src, nullptr,
			      &decoded_size, &end, variant) != 0 ||
	    end != src.data() + src.size())
		return std::nullopt;

	buffer.resize(decoded_size);
	return buffer;
}
