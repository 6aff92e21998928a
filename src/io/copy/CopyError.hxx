// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>
#include <system_error>
#include <type_traits>

/**
 * Failure conditions detected by the copy primitives themselves.
 * Failed system calls are reported as plain std::system_error with
 * the errno value instead (see MakeErrno()).
 */
enum class CopyErrc {
	/**
	 * The source delivered end-of-file before the requested
	 * number of bytes was copied.
	 */
	SOURCE_EXHAUSTED = 1,

	/**
	 * The destination accepted fewer bytes than were read from
	 * the source.
	 */
	DESTINATION_INCOMPLETE,

	/**
	 * The destination accepted no bytes at all.
	 */
	DESTINATION_FAILED,

	/**
	 * The operation is not available on this platform or for
	 * this file.  Callers should fall back to a plain byte copy.
	 */
	UNSUPPORTED,
};

template<>
struct std::is_error_code_enum<CopyErrc> : std::true_type {};

[[gnu::const]]
const std::error_category &
CopyErrorCategory() noexcept;

[[gnu::const]]
inline std::error_code
make_error_code(CopyErrc code) noexcept
{
	return {static_cast<int>(code), CopyErrorCategory()};
}

class CopyError : public std::system_error {
public:
	explicit CopyError(CopyErrc code)
		:std::system_error(make_error_code(code)) {}

	CopyError(CopyErrc code, const char *msg)
		:std::system_error(make_error_code(code), msg) {}

	CopyErrc GetCode() const noexcept {
		return static_cast<CopyErrc>(code().value());
	}
};

[[gnu::pure]]
inline bool
IsCopyError(const std::system_error &e, CopyErrc code) noexcept
{
	return e.code() == make_error_code(code);
}

/**
 * Was this exception thrown because the requested operation is not
 * supported?  This is not a fatal condition; the caller should use
 * the generic byte copy instead.
 */
[[gnu::pure]]
bool
IsUnsupported(const std::exception &e) noexcept;

[[gnu::pure]]
bool
IsUnsupported(std::exception_ptr ep) noexcept;
