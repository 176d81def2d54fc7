// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "cloudfront/Config.hxx"
#include "cloudfront/Signer.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <fmt/core.h>

#include <chrono>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static int
Usage() noexcept
{
	fprintf(stderr,
		"usage: cf-sign [-v] CONFIG url PATH [QUERY]\n"
		"       cf-sign [-v] CONFIG cookie RESOURCE\n");
	return EXIT_FAILURE;
}

int
main(int argc, char **argv) noexcept
try {
	unsigned log_level = 1;

	int i = 1;
	for (; i < argc && strcmp(argv[i], "-v") == 0; ++i)
		++log_level;

	if (argc - i < 3)
		return Usage();

	SetLogLevel(log_level);

	const char *const config_path = argv[i++];
	const char *const command = argv[i++];
	const int n_args = argc - i;

	const auto config = CloudFront::LoadConfig(config_path);
	const auto signer = CloudFront::MakeSigner(config);

	const auto expires = std::chrono::system_clock::now() + config.lifetime;

	if (strcmp(command, "url") == 0) {
		if (n_args > 2)
			return Usage();

		const char *const query_string = n_args > 1 ? argv[i + 1] : "";
		fmt::print("{}\n",
			   signer.CannedSignedUrl(argv[i], query_string, expires));
	} else if (strcmp(command, "cookie") == 0) {
		if (n_args != 1)
			return Usage();

		const auto cookie = signer.Cookie(argv[i], expires);
		fmt::print("{}={}\n{}={}\n{}={}\n",
			   CloudFront::POLICY_COOKIE, cookie.policy,
			   CloudFront::SIGNATURE_COOKIE, cookie.signature,
			   CloudFront::KEY_PAIR_ID_COOKIE, cookie.key_pair_id);
	} else
		return Usage();

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
