// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "system/Error.hxx"

#include <cstddef>
#include <utility>

#include <sys/types.h>

/**
 * Check the return value of a system call which uses -1 to indicate
 * failure.  On failure, throw std::system_error with the current
 * "errno"; otherwise return the given value.
 *
 * This must be invoked directly on the system call's result, with
 * no other library call in between which may clobber "errno".
 */
template<typename T>
T
ResultOrErrno(ssize_t result, T &&value, const char *msg)
{
	if (result == -1) [[unlikely]]
		throw MakeErrno(msg);

	return std::forward<T>(value);
}

/**
 * Like ResultOrErrno(), but return the (non-negative) result itself,
 * e.g. the number of bytes transferred by read() or write().
 */
inline std::size_t
ResultOrErrno(ssize_t result, const char *msg)
{
	return ResultOrErrno(result, static_cast<std::size_t>(result), msg);
}
