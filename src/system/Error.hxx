// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <system_error> // IWYU pragma: export
#include <utility>

#include <errno.h>

/**
 * Returns the error_category to be used to wrap errno values.
 */
static inline const std::error_category &
ErrnoCategory() noexcept
{
	return std::system_category();
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(std::error_code(code, ErrnoCategory()),
				 msg);
}

/**
 * Construct a std::system_error from the current value of "errno".
 * This must be called right after the failed system call, without
 * any intervening library call which may modify "errno".
 */
[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

[[gnu::pure]]
inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == ErrnoCategory() &&
		e.code().value() == code;
}

[[gnu::pure]]
static inline bool
IsFileNotFound(const std::system_error &e) noexcept
{
	return IsErrno(e, ENOENT);
}

[[gnu::pure]]
static inline bool
IsPathNotFound(const std::system_error &e) noexcept
{
	return IsErrno(e, ENOENT) || IsErrno(e, ENOTDIR);
}

[[gnu::pure]]
static inline bool
IsAccessDenied(const std::system_error &e) noexcept
{
	return IsErrno(e, EACCES) || IsErrno(e, EPERM);
}
