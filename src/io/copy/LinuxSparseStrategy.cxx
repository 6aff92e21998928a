// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LinuxSparseStrategy.hxx"
#include "CopyError.hxx"
#include "ErrnoResult.hxx"
#include "io/FileDescriptor.hxx"

#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>

/**
 * st_blocks is always in 512 byte units, regardless of the
 * filesystem's block size.
 */
static constexpr off_t STAT_BLOCK_SIZE = 512;

static struct stat
Stat(FileDescriptor fd)
{
	struct stat st;
	return ResultOrErrno(fstat(fd.Get(), &st), st,
			     "Failed to get file information");
}

bool
LinuxSparseStrategy::ProbablySparse(FileDescriptor fd) const
{
	const auto st = Stat(fd);
	return S_ISREG(st.st_mode) &&
		st.st_blocks < st.st_size / STAT_BLOCK_SIZE;
}

void
LinuxSparseStrategy::AllocateFile(FileDescriptor fd,
				  uint_least64_t length) const
{
	/* discard old contents first; otherwise they would show
	   through where the source has holes */
	if (!fd.TruncateWrite(0) || !fd.TruncateWrite(length))
		throw MakeErrno("Failed to set file size");
}

/**
 * A wrapper for lseek() with SEEK_DATA or SEEK_HOLE.  Returns
 * #size if there is nothing more to find (ENXIO).
 */
static off_t
SeekSparse(FileDescriptor fd, off_t position, int whence, off_t size)
{
	const off_t result = lseek(fd.Get(), position, whence);
	if (result < 0) [[unlikely]] {
		switch (const int e = errno) {
		case ENXIO:
			return size;

		case EINVAL:
			/* SEEK_DATA/SEEK_HOLE not implemented */
			throw CopyError{CopyErrc::UNSUPPORTED,
					"Hole detection is not supported"};

		default:
			throw MakeErrno(e, "Failed to seek in sparse file");
		}
	}

	return result;
}

SparseSegment
LinuxSparseStrategy::NextSparseSegment(FileDescriptor src, FileDescriptor dst,
				       uint_least64_t position) const
{
	const off_t size = Stat(src).st_size;
	if ((off_t)position >= size)
		return {{(uint_least64_t)size, 0}, (uint_least64_t)size};

	const off_t data = SeekSparse(src, position, SEEK_DATA, size);
	const off_t hole = data < size
		? SeekSparse(src, data, SEEK_HOLE, size)
		: size;

	if (src.Seek(data) < 0)
		throw MakeErrno("Failed to seek in source file");

	if (dst.Seek(data) < 0)
		throw MakeErrno("Failed to seek in destination file");

	return {
		{(uint_least64_t)data, (uint_least64_t)(hole - data)},
		(uint_least64_t)hole,
	};
}
