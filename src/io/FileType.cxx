// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileType.hxx"
#include "FileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fcntl.h> // for AT_SYMLINK_NOFOLLOW

FileType
GetFileType(FileDescriptor directory, const char *name)
{
	struct stat st;
	if (fstatat(directory.Get(), name, &st, AT_SYMLINK_NOFOLLOW) < 0)
		throw FmtErrno("Failed to stat {:?}", name);

	return ToFileType(st.st_mode);
}
