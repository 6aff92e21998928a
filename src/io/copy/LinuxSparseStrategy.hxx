// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SparseStrategy.hxx"

/**
 * Sparse file support using st_blocks, lseek(SEEK_DATA/SEEK_HOLE)
 * and ftruncate().
 */
class LinuxSparseStrategy final : public SparseStrategy {
public:
	bool ProbablySparse(FileDescriptor fd) const override;
	void AllocateFile(FileDescriptor fd,
			  uint_least64_t length) const override;

	/**
	 * In addition to returning the segment, this moves the file
	 * pointers of both files to the start of the data segment,
	 * so it can be copied with CopyBytes().
	 */
	SparseSegment NextSparseSegment(FileDescriptor src,
					FileDescriptor dst,
					uint_least64_t position) const override;
};
