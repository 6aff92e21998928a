// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ByteRange.hxx"

#include <cstdint>

class FileDescriptor;

/**
 * One step of enumerating the data segments of a sparse file.
 */
struct SparseSegment {
	/**
	 * The next data segment at or after the requested position.
	 * It is empty if there is no more data until the end of the
	 * file.  The region between the requested position and
	 * data.offset is a hole.
	 */
	ByteRange data;

	/**
	 * The position from which to continue scanning.
	 */
	uint_least64_t next;
};

/**
 * Platform support for sparse files.  Use GetSparseStrategy() to
 * obtain the implementation for this platform.
 *
 * Methods which are not supported throw #CopyError with
 * CopyErrc::UNSUPPORTED; this means "use the generic byte copy", not
 * failure.  Other errors are thrown as std::system_error.
 */
class SparseStrategy {
public:
	virtual ~SparseStrategy() noexcept = default;

	/**
	 * Guess whether the file has holes, by comparing the number
	 * of allocated blocks with its size.
	 */
	virtual bool ProbablySparse(FileDescriptor fd) const = 0;

	/**
	 * Discard the contents of the destination file and set its
	 * size without writing data, so it reads as zeroes and holes
	 * in the source remain holes.
	 */
	virtual void AllocateFile(FileDescriptor fd,
				  uint_least64_t length) const = 0;

	/**
	 * Find the next data segment in #src, starting at #position.
	 * Returns a finite sequence when called repeatedly with the
	 * returned #SparseSegment::next position until it reaches
	 * the file size.
	 */
	virtual SparseSegment NextSparseSegment(FileDescriptor src,
						FileDescriptor dst,
						uint_least64_t position) const = 0;
};

/**
 * The implementation for platforms without sparse file support:
 * nothing is sparse and everything else is unsupported.
 */
class FallbackSparseStrategy final : public SparseStrategy {
public:
	bool ProbablySparse(FileDescriptor fd) const override;
	void AllocateFile(FileDescriptor fd,
			  uint_least64_t length) const override;
	SparseSegment NextSparseSegment(FileDescriptor src,
					FileDescriptor dst,
					uint_least64_t position) const override;
};

/**
 * Returns the #SparseStrategy for the platform this library was
 * built for.
 */
[[gnu::const]]
const SparseStrategy &
GetSparseStrategy() noexcept;

[[gnu::const]]
const SparseStrategy &
GetFallbackSparseStrategy() noexcept;

/**
 * Copy a sparse file: replace the destination with an empty file of
 * #size bytes, then copy only the data segments at their offsets,
 * leaving holes unwritten.
 *
 * Throws #CopyError with CopyErrc::UNSUPPORTED if the strategy does
 * not support this; in that case, nothing has been copied yet.
 *
 * Throws CopyErrc::SOURCE_EXHAUSTED if the source is shorter than
 * #size.  This is checked before the destination is touched; only if
 * the source shrinks during the copy, the destination has already
 * been resized to #size.
 *
 * @return the number of bytes in the destination file (#size)
 */
uint_least64_t
CopySparse(const SparseStrategy &strategy,
	   FileDescriptor src, FileDescriptor dst, uint_least64_t size);
