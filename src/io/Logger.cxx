// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "lib/fmt/ToBuffer.hxx"
#include "util/Exception.hxx"

#include <array>
#include <string>

#include <sys/uio.h>
#include <unistd.h>

std::atomic_uint LoggerDetail::max_level{1};

static constexpr struct iovec
MakeIovec(std::string_view s) noexcept
{
	return { const_cast<char *>(s.data()), s.size() };
}

void
LoggerDetail::WriteV(std::string_view domain,
		     std::span<const std::string_view> buffers) noexcept
{
	std::array<struct iovec, 16> v;
	std::size_t n = 0;

	if (!domain.empty()) {
		v[n++] = MakeIovec("[");
		v[n++] = MakeIovec(domain);
		v[n++] = MakeIovec("] ");
	}

	for (const auto i : buffers) {
		if (n >= v.size() - 1)
			break;

		v[n++] = MakeIovec(i);
	}

	v[n++] = MakeIovec("\n");

	/* nowhere to report a failure to */
	[[maybe_unused]] ssize_t nbytes = writev(STDERR_FILENO, v.data(), n);
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	const auto msg = VFmtBuffer<1024>(format_str, args);

	const std::string_view s[]{msg};
	WriteV(domain, s);
}

void
LoggerDetail::LogException(unsigned level, std::string_view domain,
			   std::string_view msg, std::exception_ptr ep) noexcept
{
	if (!CheckLevel(level))
		return;

	const std::string full = GetFullMessage(std::move(ep));
	const std::string_view s[]{msg, ": ", full};
	WriteV(domain, s);
}
