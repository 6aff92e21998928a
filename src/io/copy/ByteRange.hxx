// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * A contiguous span of bytes within a file.
 */
struct ByteRange {
	uint_least64_t offset, length;

	constexpr bool empty() const noexcept {
		return length == 0;
	}

	/**
	 * The first offset after this range.
	 */
	constexpr uint_least64_t end() const noexcept {
		return offset + length;
	}

	constexpr bool Overlaps(const ByteRange &other) const noexcept {
		return offset < other.end() && other.offset < end();
	}

	constexpr bool operator==(const ByteRange &) const noexcept = default;
};
