// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ToBuffer.hxx"

#include <stdexcept> // IWYU pragma: export

[[nodiscard]] [[gnu::pure]]
inline std::runtime_error
VFmtRuntimeError(fmt::string_view format_str, fmt::format_args args) noexcept
{
	const auto msg = VFmtBuffer<512>(format_str, args);
	return std::runtime_error{msg.c_str()};
}

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::runtime_error
FmtRuntimeError(const S &format_str, Args&&... args) noexcept
{
	return VFmtRuntimeError(format_str,
				fmt::make_format_args(args...));
}
