// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CopyRegularFile.hxx"
#include "FileDescriptor.hxx"
#include "Logger.hxx"
#include "copy/CopyBytes.hxx"
#include "copy/CopyConfig.hxx"
#include "copy/CopyError.hxx"
#include "copy/SparseStrategy.hxx"
#include "system/Error.hxx"

#include <fcntl.h> // for posix_fadvise()

static const LLogger logger{"copy"};

/**
 * Attempt to copy only the data segments.
 *
 * Throws on error.
 *
 * @return true on success, false if sparse copying is not supported
 * (no data has been copied)
 */
static bool
TryCopySparse(const SparseStrategy &strategy,
	      FileDescriptor src, FileDescriptor dst, off_t size)
{
	try {
		CopySparse(strategy, src, dst, size);
	} catch (const CopyError &e) {
		if (e.GetCode() != CopyErrc::UNSUPPORTED)
			throw;

		logger(3, "Sparse copy not possible, copying all data",
		       std::current_exception());
		return false;
	}

	/* CopySparse() works with offsets; leave the file pointers
	   where a sequential copy would have left them */
	if (src.Seek(size) < 0 || dst.Seek(size) < 0)
		throw MakeErrno("Failed to seek");

	return true;
}

void
CopyRegularFile(FileDescriptor src, FileDescriptor dst, off_t size,
		const CopyConfig &config)
{
	if (size <= 0)
		return;

	if (config.sparse) {
		const auto &strategy = GetSparseStrategy();
		if (strategy.ProbablySparse(src)) {
			logger.Fmt(4, "Source is sparse ({} bytes)", size);

			/* segments are addressed by absolute offsets,
			   which requires both files to be at the
			   beginning */
			if (src.Tell() == 0 && dst.Tell() == 0 &&
			    TryCopySparse(strategy, src, dst, size))
				return;
		}
	}

	posix_fadvise(src.Get(), 0, size, POSIX_FADV_SEQUENTIAL);

	if (config.kernel_copy) {
		logger.Fmt(4, "Copying {} bytes with copy_file_range()", size);
		CopyFileBytes(src, dst, size);
	} else {
		logger.Fmt(4, "Copying {} bytes in user space", size);
		CopyBytes(src, dst, size);
	}
}
