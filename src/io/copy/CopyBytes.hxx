// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

class FileDescriptor;

/*
 * All functions in this header copy exactly the requested number of
 * bytes or throw; they never report partial success.  A premature
 * end of the source throws #CopyError with
 * CopyErrc::SOURCE_EXHAUSTED, a short write to the destination throws
 * #CopyError with CopyErrc::DESTINATION_INCOMPLETE and failed system
 * calls throw std::system_error.
 *
 * The caller owns both file descriptors.  A zero length is allowed
 * and does nothing.
 */

/**
 * Copy #length bytes starting at #offset in the source to the same
 * offset in the destination, using pread() and pwrite().  The file
 * pointers are not used and not modified, therefore this function
 * may be called concurrently on the same pair of file descriptors as
 * long as the ranges do not overlap.
 *
 * @return the number of bytes copied (always #length)
 */
uint_least64_t
CopyRange(FileDescriptor src, FileDescriptor dst,
	  uint_least64_t length, uint_least64_t offset);

/**
 * Copy #length bytes from the current file pointer of the source to
 * the current file pointer of the destination.  Both file pointers
 * advance by #length.  A read interrupted by a signal is retried.
 *
 * This must not be used concurrently with any other copy on the same
 * file descriptors.
 *
 * @return the number of bytes copied (always #length)
 */
uint_least64_t
CopyBytes(FileDescriptor src, FileDescriptor dst, uint_least64_t length);

/**
 * Like CopyBytes(), but let the kernel copy the data with
 * copy_file_range() if possible.  Falls back to CopyBytes() if the
 * kernel or the filesystems do not support it.
 */
uint_least64_t
CopyFileBytes(FileDescriptor src, FileDescriptor dst, uint_least64_t length);

/**
 * Like CopyRange(), but let the kernel copy the data with
 * copy_file_range() (with explicit offsets) if possible.  Falls back
 * to CopyRange().  This is the building block for copying large
 * files in parallel chunks.
 */
uint_least64_t
CopyFileOffset(FileDescriptor src, FileDescriptor dst,
	       uint_least64_t length, uint_least64_t offset);
