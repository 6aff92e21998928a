// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CopyError.hxx"

#include <string>

class CopyErrorCategoryImpl final : public std::error_category {
public:
	const char *name() const noexcept override {
		return "copy";
	}

	std::string message(int condition) const override;
};

std::string
CopyErrorCategoryImpl::message(int condition) const
{
	switch (static_cast<CopyErrc>(condition)) {
	case CopyErrc::SOURCE_EXHAUSTED:
		return "Source file ended prematurely";

	case CopyErrc::DESTINATION_INCOMPLETE:
		return "Short write to destination file";

	case CopyErrc::DESTINATION_FAILED:
		return "Failed to write to destination file";

	case CopyErrc::UNSUPPORTED:
		return "Operation not supported";
	}

	return "Unknown copy error";
}

const std::error_category &
CopyErrorCategory() noexcept
{
	static const CopyErrorCategoryImpl instance;
	return instance;
}

bool
IsUnsupported(const std::exception &e) noexcept
{
	const auto *se = dynamic_cast<const std::system_error *>(&e);
	return se != nullptr && IsCopyError(*se, CopyErrc::UNSUPPORTED);
}

bool
IsUnsupported(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return IsUnsupported(e);
	} catch (...) {
		return false;
	}
}
