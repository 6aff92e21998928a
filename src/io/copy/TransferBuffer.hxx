// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>

/**
 * A scratch buffer for user-space copy loops, sized to match a
 * typical disk block.
 *
 * The memory is not initialized.  Only the portion which was filled
 * by the last read is ever exposed via Filled().
 */
class TransferBuffer {
public:
	static constexpr std::size_t SIZE = 4096;

private:
	std::array<std::byte, SIZE> data;

	std::size_t fill = 0;

public:
	TransferBuffer() noexcept {}

	TransferBuffer(const TransferBuffer &) = delete;
	TransferBuffer &operator=(const TransferBuffer &) = delete;

	/**
	 * Returns a writable window for the next read, not larger
	 * than #max bytes.  Discards the previous contents.
	 */
	std::span<std::byte> Prepare(uint_least64_t max) noexcept {
		fill = 0;
		return std::span{data}.first(std::min<uint_least64_t>(max, SIZE));
	}

	/**
	 * Declare that the given number of bytes have been read into
	 * the window returned by Prepare().
	 */
	void Commit(std::size_t nbytes) noexcept {
		assert(nbytes <= SIZE);
		fill = nbytes;
	}

	std::span<const std::byte> Filled() const noexcept {
		return std::span{data}.first(fill);
	}
};
