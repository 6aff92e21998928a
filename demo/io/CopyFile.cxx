// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "io/CopyRegularFile.hxx"
#include "io/Logger.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "io/copy/CopyConfig.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/PrintException.hxx"

#include <fmt/core.h>

#include <fcntl.h>
#include <stdlib.h>

int
main(int argc, char **argv)
try {
	if (argc < 3 || argc > 4) {
		fmt::print(stderr, "Usage: {} SRC DST [CONFIG]\n", argv[0]);
		return EXIT_FAILURE;
	}

	const char *const src_path = argv[1];
	const char *const dst_path = argv[2];

	CopyConfig config;
	if (argc > 3)
		config = LoadCopyConfig(argv[3]);

	SetLogLevel(config.log_level);

	const auto src = OpenReadOnly(src_path);
	if (!src.IsRegularFile())
		throw FmtRuntimeError("Not a regular file: {:?}", src_path);

	const off_t size = src.GetSize();
	if (size < 0)
		throw FmtErrno("Failed to stat {:?}", src_path);

	const auto dst = OpenWriteOnly(dst_path, O_TRUNC);
	CopyRegularFile(src, dst, size, config);

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
