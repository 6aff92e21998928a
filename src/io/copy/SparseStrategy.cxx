// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SparseStrategy.hxx"
#include "CopyBytes.hxx"
#include "CopyError.hxx"
#include "io/FileDescriptor.hxx"
#include "system/Error.hxx"

#ifdef __linux__
#include "LinuxSparseStrategy.hxx"
#endif

#include <algorithm>

bool
FallbackSparseStrategy::ProbablySparse(FileDescriptor) const
{
	return false;
}

void
FallbackSparseStrategy::AllocateFile(FileDescriptor, uint_least64_t) const
{
	throw CopyError{CopyErrc::UNSUPPORTED,
			"Sparse file allocation is not supported"};
}

SparseSegment
FallbackSparseStrategy::NextSparseSegment(FileDescriptor, FileDescriptor,
					  uint_least64_t) const
{
	throw CopyError{CopyErrc::UNSUPPORTED,
			"Sparse file enumeration is not supported"};
}

const SparseStrategy &
GetFallbackSparseStrategy() noexcept
{
	static const FallbackSparseStrategy instance{};
	return instance;
}

const SparseStrategy &
GetSparseStrategy() noexcept
{
#ifdef __linux__
	static const LinuxSparseStrategy instance{};
	return instance;
#else
	return GetFallbackSparseStrategy();
#endif
}

uint_least64_t
CopySparse(const SparseStrategy &strategy,
	   FileDescriptor src, FileDescriptor dst, uint_least64_t size)
{
	const off_t src_size = src.GetSize();
	if (src_size < 0)
		throw MakeErrno("Failed to get source file size");

	if ((uint_least64_t)src_size < size)
		throw CopyError{CopyErrc::SOURCE_EXHAUSTED,
				"Source file is shorter than requested"};

	strategy.AllocateFile(dst, size);

	uint_least64_t position = 0;
	while (position < size) {
		const auto segment = strategy.NextSparseSegment(src, dst,
								position);
		if (segment.next <= position) [[unlikely]]
			/* the source has shrunk meanwhile */
			throw CopyError{CopyErrc::SOURCE_EXHAUSTED,
					"Source file ended prematurely"};

		if (!segment.data.empty() && segment.data.offset < size) {
			/* the source may be larger than the portion
			   we were asked to copy */
			const auto end = std::min(segment.data.end(), size);
			CopyFileOffset(src, dst, end - segment.data.offset,
				       segment.data.offset);
		}

		position = segment.next;
	}

	return size;
}
