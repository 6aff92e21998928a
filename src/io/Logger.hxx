// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <atomic>
#include <exception>
#include <span>
#include <string_view>
#include <utility>

namespace LoggerDetail {

/**
 * Range copies may run on several threads at once, all of which
 * read this.
 */
extern std::atomic_uint max_level;

inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level.load(std::memory_order_relaxed);
}

/**
 * Write one line to stderr, prefixed with the domain in square
 * brackets.  The line is submitted with a single writev() call so
 * lines from different threads do not interleave.
 */
void
WriteV(std::string_view domain, std::span<const std::string_view> buffers) noexcept;

void
Fmt(unsigned level, std::string_view domain,
    fmt::string_view format_str, fmt::format_args args) noexcept;

void
LogException(unsigned level, std::string_view domain,
	     std::string_view msg, std::exception_ptr ep) noexcept;

} /* namespace LoggerDetail */

/**
 * Messages with a level above this value are discarded.  Level 1 is
 * for errors, 2 for warnings, 3 for informational messages and 4 and
 * above for debugging.
 */
inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level.store(level, std::memory_order_relaxed);
}

inline bool
CheckLogLevel(unsigned level) noexcept
{
	return LoggerDetail::CheckLevel(level);
}

template<typename Domain>
class BasicLogger : public Domain {
public:
	BasicLogger() = default;

	template<typename D>
	explicit BasicLogger(D &&_domain)
		:Domain(std::forward<D>(_domain)) {}

	static bool CheckLevel(unsigned level) noexcept {
		return LoggerDetail::CheckLevel(level);
	}

	void operator()(unsigned level, std::string_view msg) const noexcept {
		if (!CheckLevel(level))
			return;

		const std::string_view buffers[]{msg};
		LoggerDetail::WriteV(GetDomain(), buffers);
	}

	/**
	 * Log the message followed by the full (nested) message of
	 * the exception.
	 */
	void operator()(unsigned level, std::string_view msg,
			std::exception_ptr ep) const noexcept {
		LoggerDetail::LogException(level, GetDomain(), msg,
					   std::move(ep));
	}

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::Fmt(level, GetDomain(), format_str,
				  fmt::make_format_args(args...));
	}

	std::string_view GetDomain() const noexcept {
		return Domain::GetDomain();
	}
};

/**
 * A logger domain which is a string literal.
 */
class LiteralLoggerDomain {
	std::string_view domain;

public:
	constexpr explicit LiteralLoggerDomain(std::string_view _domain={}) noexcept
		:domain(_domain) {}

	constexpr std::string_view GetDomain() const noexcept {
		return domain;
	}
};

class LLogger : public BasicLogger<LiteralLoggerDomain> {
public:
	LLogger() = default;

	template<typename D>
	explicit LLogger(D &&_domain) noexcept
		:BasicLogger(std::forward<D>(_domain)) {}
};
