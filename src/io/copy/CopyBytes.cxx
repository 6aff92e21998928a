// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CopyBytes.hxx"
#include "CopyError.hxx"
#include "ErrnoResult.hxx"
#include "TransferBuffer.hxx"
#include "io/FileDescriptor.hxx"

#include <errno.h>
#include <unistd.h> // for copy_file_range()

/**
 * Throws if the destination did not accept all bytes that were read.
 */
static void
CheckWritten(std::size_t nbytes_written, std::size_t nbytes_read)
{
	if (nbytes_written < nbytes_read) [[unlikely]] {
		if (nbytes_written == 0)
			throw CopyError{CopyErrc::DESTINATION_FAILED,
					"Destination file accepted no data"};

		throw CopyError{CopyErrc::DESTINATION_INCOMPLETE,
				"Short write to destination file"};
	}
}

[[noreturn]]
static void
ThrowSourceExhausted()
{
	throw CopyError{CopyErrc::SOURCE_EXHAUSTED,
			"Source file ended prematurely"};
}

uint_least64_t
CopyRange(FileDescriptor src, FileDescriptor dst,
	  uint_least64_t length, uint_least64_t offset)
{
	TransferBuffer buffer;

	uint_least64_t written = 0;
	while (written < length) {
		const off_t position = offset + written;

		const std::size_t nbytes =
			ResultOrErrno(src.ReadAt(position,
						 buffer.Prepare(length - written)),
				      "Failed to read from source file");
		if (nbytes == 0) [[unlikely]]
			ThrowSourceExhausted();

		buffer.Commit(nbytes);

		CheckWritten(ResultOrErrno(dst.WriteAt(position, buffer.Filled()),
					   "Failed to write to destination file"),
			     nbytes);

		written += nbytes;
	}

	return written;
}

uint_least64_t
CopyBytes(FileDescriptor src, FileDescriptor dst, uint_least64_t length)
{
	TransferBuffer buffer;

	uint_least64_t written = 0;
	while (written < length) {
		const auto nbytes = src.Read(buffer.Prepare(length - written));
		if (nbytes <= 0) [[unlikely]] {
			if (nbytes == 0)
				ThrowSourceExhausted();

			if (const int e = errno; e == EINTR)
				/* interrupted by a signal before any
				   data was read: try again */
				continue;
			else
				throw MakeErrno(e, "Failed to read from source file");
		}

		buffer.Commit(nbytes);

		CheckWritten(ResultOrErrno(dst.Write(buffer.Filled()),
					   "Failed to write to destination file"),
			     nbytes);

		written += nbytes;
	}

	return written;
}

/**
 * Does this copy_file_range() error mean that the kernel cannot copy
 * between these two files, so user space has to do it?
 */
static constexpr bool
IsKernelCopyUnsupported(int e) noexcept
{
	switch (e) {
	case ENOSYS:
	case EXDEV:
	case EINVAL:
	case EOPNOTSUPP:
	case EBADF:
	case ETXTBSY:
		return true;

	default:
		return false;
	}
}

/**
 * Copy as much as possible with copy_file_range().  If an offset
 * pointer is nullptr, the file pointer is used (and advanced).
 *
 * Throws on error.
 *
 * @return the number of bytes copied; if this is less than #length,
 * the kernel either does not support copying between these files or
 * the source has ended, and the caller shall continue in user space
 */
static uint_least64_t
KernelCopy(FileDescriptor src, off64_t *src_offset,
	   FileDescriptor dst, off64_t *dst_offset,
	   uint_least64_t length)
{
	uint_least64_t copied = 0;

	while (copied < length) {
		const auto nbytes = copy_file_range(src.Get(), src_offset,
						    dst.Get(), dst_offset,
						    length - copied, 0);
		if (nbytes <= 0) [[unlikely]] {
			if (nbytes == 0)
				/* end of file, or a special file which
				   copy_file_range() reports as empty;
				   let user space sort this out */
				break;

			if (const int e = errno; IsKernelCopyUnsupported(e))
				break;
			else if (e != EINTR)
				throw MakeErrno(e, "Failed to copy file data");

			continue;
		}

		copied += nbytes;
	}

	return copied;
}

uint_least64_t
CopyFileBytes(FileDescriptor src, FileDescriptor dst, uint_least64_t length)
{
	const auto copied = KernelCopy(src, nullptr, dst, nullptr, length);
	if (copied < length)
		CopyBytes(src, dst, length - copied);

	return length;
}

uint_least64_t
CopyFileOffset(FileDescriptor src, FileDescriptor dst,
	       uint_least64_t length, uint_least64_t offset)
{
	off64_t src_offset = offset, dst_offset = offset;
	const auto copied = KernelCopy(src, &src_offset, dst, &dst_offset,
				       length);
	if (copied < length)
		CopyRange(src, dst, length - copied, offset + copied);

	return length;
}
