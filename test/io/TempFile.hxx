// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "system/Error.hxx"

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <stdlib.h>

/**
 * A temporary directory which is deleted recursively by the
 * destructor.
 */
class TempDirectory {
	std::filesystem::path path;

public:
	TempDirectory() {
		const char *tmpdir = getenv("TMPDIR");
		std::string pattern = tmpdir != nullptr ? tmpdir : "/tmp";
		pattern += "/filecopy-test-XXXXXX";
		if (mkdtemp(pattern.data()) == nullptr)
			throw MakeErrno("Failed to create temporary directory");

		path = std::move(pattern);
	}

	~TempDirectory() noexcept {
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}

	TempDirectory(const TempDirectory &) = delete;
	TempDirectory &operator=(const TempDirectory &) = delete;

	const std::filesystem::path &GetPath() const noexcept {
		return path;
	}

	std::string operator()(const char *name) const {
		return (path / name).native();
	}
};

/**
 * Create (or replace) a file with the given contents.
 */
inline void
WriteTestFile(const std::string &path, std::span<const std::byte> data)
{
	const auto fd = OpenWriteOnly(path.c_str(), O_TRUNC);

	while (!data.empty()) {
		const auto nbytes = fd.Write(data);
		if (nbytes <= 0)
			throw MakeErrno("Failed to write test file");

		data = data.subspan(nbytes);
	}
}

inline void
WriteTestFile(const std::string &path, std::string_view data)
{
	WriteTestFile(path, std::as_bytes(std::span{data}));
}

inline std::string
ReadTestFile(const std::string &path)
{
	const auto fd = OpenReadOnly(path.c_str());

	std::string result;
	char buffer[8192];
	ssize_t nbytes;
	while ((nbytes = fd.Read(buffer, sizeof(buffer))) > 0)
		result.append(buffer, nbytes);

	if (nbytes < 0)
		throw MakeErrno("Failed to read test file");

	return result;
}

/**
 * Generate deterministic non-repeating test data, so misplaced
 * blocks are detected.
 */
inline std::string
MakeTestData(std::size_t size)
{
	std::string data;
	data.reserve(size);
	for (std::size_t i = 0; i < size; ++i)
		data.push_back(static_cast<char>((i * 7 + i / 4096) & 0xff));
	return data;
}
