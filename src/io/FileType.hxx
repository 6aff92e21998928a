// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/stat.h>

class FileDescriptor;

/**
 * The kinds of directory entries a copy operation distinguishes.
 */
enum class FileType {
	FILE,
	DIRECTORY,
	SYMLINK,

	/**
	 * Anything else, e.g. devices, sockets, pipes.
	 */
	UNKNOWN,
};

constexpr FileType
ToFileType(mode_t mode) noexcept
{
	if (S_ISDIR(mode))
		return FileType::DIRECTORY;
	else if (S_ISREG(mode))
		return FileType::FILE;
	else if (S_ISLNK(mode))
		return FileType::SYMLINK;
	else
		return FileType::UNKNOWN;
}

/**
 * Determine the type of a directory entry.  Symlinks are not
 * followed.
 *
 * Throws on error.
 */
FileType
GetFileType(FileDescriptor directory, const char *name);
