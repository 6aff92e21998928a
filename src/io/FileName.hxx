// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>

/**
 * Is this "." or ".."?
 */
[[gnu::pure]]
constexpr bool
IsSpecialFilename(const char *s) noexcept
{
	return s[0] == '.' && (s[1] == 0 || (s[1] == '.' && s[2] == 0));
}

/**
 * Is this a hidden file, i.e. does its name begin with a dot?  This
 * includes the special names "." and "..".
 */
[[gnu::pure]]
constexpr bool
IsHiddenFilename(const char *s) noexcept
{
	return s[0] == '.';
}

/**
 * Is this path empty, i.e. equal to a default-constructed path?  This
 * is used to detect path arguments which were not set.
 */
[[gnu::pure]]
inline bool
IsEmptyPath(const std::filesystem::path &path) noexcept
{
	return path == std::filesystem::path{};
}
