// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fcntl.h>

UniqueFileDescriptor
OpenReadOnly(const char *path, int flags)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_RDONLY|flags))
		throw FmtErrno("Failed to open {:?}", path);

	return fd;
}

UniqueFileDescriptor
OpenReadOnly(FileDescriptor directory, const char *name, int flags)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(directory, name, O_RDONLY|flags))
		throw FmtErrno("Failed to open {:?}", name);

	return fd;
}

UniqueFileDescriptor
OpenWriteOnly(const char *path, int flags, mode_t mode)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_CREAT|O_WRONLY|flags, mode))
		throw FmtErrno("Failed to create {:?}", path);

	return fd;
}

UniqueFileDescriptor
OpenWriteOnly(FileDescriptor directory, const char *name, int flags,
	      mode_t mode)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(directory, name, O_CREAT|O_WRONLY|flags, mode))
		throw FmtErrno("Failed to create {:?}", name);

	return fd;
}

UniqueFileDescriptor
OpenDirectory(const char *path, int flags)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_DIRECTORY|O_RDONLY|flags))
		throw FmtErrno("Failed to open {:?}", path);

	return fd;
}
