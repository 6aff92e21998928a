// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "FileDescriptor.hxx"

#include <array>
#include <cstddef>

/**
 * Reads a text file line by line.
 */
class BufferedReader {
	static constexpr std::size_t MAX_SIZE = 16384;

	const FileDescriptor fd;

	std::array<char, MAX_SIZE> buffer;

	/**
	 * The range of #buffer which has been read but not yet
	 * consumed.
	 */
	std::size_t start = 0, end = 0;

	/**
	 * The number of the line most recently returned by
	 * ReadLine(), starting at 1.
	 */
	unsigned line_number = 0;

	bool eof = false;

public:
	explicit BufferedReader(FileDescriptor _fd) noexcept
		:fd(_fd) {}

	BufferedReader(const BufferedReader &) = delete;
	BufferedReader &operator=(const BufferedReader &) = delete;

	/**
	 * Read one line; the line terminator is removed and replaced
	 * with a null byte.  The returned pointer is valid until the
	 * next call.
	 *
	 * Throws on error.
	 *
	 * @return the line or nullptr on end of file
	 */
	char *ReadLine();

	unsigned GetLineNumber() const noexcept {
		return line_number;
	}

private:
	/**
	 * Read more data into the buffer.
	 *
	 * @return false if the file has ended
	 */
	bool Fill();
};
