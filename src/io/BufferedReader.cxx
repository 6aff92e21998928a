// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BufferedReader.hxx"
#include "system/Error.hxx"

#include <algorithm>
#include <span>
#include <stdexcept>

#include <string.h>

bool
BufferedReader::Fill()
{
	if (eof)
		return false;

	if (start > 0) {
		/* move the unconsumed data to the beginning */
		std::copy(buffer.begin() + start, buffer.begin() + end,
			  buffer.begin());
		end -= start;
		start = 0;
	}

	/* reserve one byte for the null terminator */
	if (end >= buffer.size() - 1)
		throw std::runtime_error{"Line is too long"};

	const std::span<char> dest{buffer.data() + end,
				   buffer.size() - 1 - end};

	ssize_t nbytes;
	do {
		nbytes = fd.Read(std::as_writable_bytes(dest));
	} while (nbytes < 0 && errno == EINTR);

	if (nbytes < 0)
		throw MakeErrno("Failed to read");

	if (nbytes == 0) {
		eof = true;
		return false;
	}

	end += nbytes;
	return true;
}

char *
BufferedReader::ReadLine()
{
	while (true) {
		char *const begin = buffer.data() + start;
		char *const newline = (char *)memchr(begin, '\n', end - start);
		if (newline != nullptr) {
			*newline = 0;
			start = newline + 1 - buffer.data();
			++line_number;
			return begin;
		}

		if (!Fill())
			break;
	}

	if (start == end)
		return nullptr;

	/* the last line has no terminator */
	char *const line = buffer.data() + start;
	buffer[end] = 0;
	start = end;
	++line_number;
	return line;
}
