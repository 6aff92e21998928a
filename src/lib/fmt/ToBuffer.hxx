// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/StringBuffer.hxx"

#include <fmt/format.h>

#include <algorithm>

/**
 * Format into a fixed-size #StringBuffer, truncating the output if it
 * does not fit.
 */
template<std::size_t size>
[[nodiscard]] [[gnu::pure]]
auto
VFmtBuffer(fmt::string_view format_str, fmt::format_args args) noexcept
{
	StringBuffer<size> buffer;
	const auto result = fmt::vformat_to_n(buffer.begin(),
					      buffer.capacity() - 1,
					      format_str, args);
	*std::min(result.out, buffer.begin() + buffer.capacity() - 1) = 0;
	return buffer;
}

template<std::size_t size, typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
auto
FmtBuffer(const S &format_str, Args&&... args) noexcept
{
	return VFmtBuffer<size>(format_str, fmt::make_format_args(args...));
}
