// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/types.h>

class FileDescriptor;
class UniqueFileDescriptor;

/**
 * Open a file for reading.
 *
 * Throws std::system_error on error.
 */
UniqueFileDescriptor
OpenReadOnly(const char *path, int flags=0);

UniqueFileDescriptor
OpenReadOnly(FileDescriptor directory, const char *name, int flags=0);

/**
 * Open a file for writing; it is created if it does not exist.
 *
 * Throws std::system_error on error.
 */
UniqueFileDescriptor
OpenWriteOnly(const char *path, int flags=0, mode_t mode=0666);

UniqueFileDescriptor
OpenWriteOnly(FileDescriptor directory, const char *name, int flags=0,
	      mode_t mode=0666);

UniqueFileDescriptor
OpenDirectory(const char *path, int flags=0);
