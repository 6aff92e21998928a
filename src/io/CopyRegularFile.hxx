// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/types.h> // for off_t

class FileDescriptor;
struct CopyConfig;

/**
 * Copy all data from one regular file to the other, starting at the
 * current file pointers.  Sparse files are copied segment by segment
 * (if enabled and supported); everything else is copied with
 * copy_file_range() or, if that is not available, in user space.
 *
 * The caller owns both file descriptors; this function does not
 * decide whether the destination may be overwritten.
 *
 * Throws on error.
 *
 * @param size the number of bytes to be copied, usually the size of
 * the source file
 */
void
CopyRegularFile(FileDescriptor src, FileDescriptor dst, off_t size,
		const CopyConfig &config);
