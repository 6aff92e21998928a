// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "io/copy/CopyError.hxx"
#include "io/copy/ErrnoResult.hxx"
#include "io/FileDescriptor.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <errno.h>
#include <string.h>

TEST(ResultOrErrno, Success)
{
	errno = EIO;
	EXPECT_EQ(ResultOrErrno(0, std::string{"foo"}, "x"), "foo");
	EXPECT_EQ(ResultOrErrno(42, 7, "x"), 7);
	EXPECT_EQ(ResultOrErrno(1234, "x"), 1234U);
}

TEST(ResultOrErrno, Failure)
{
	errno = ENOSPC;

	try {
		ResultOrErrno(-1, 7, "Failed to write");
		FAIL();
	} catch (const std::system_error &e) {
		EXPECT_TRUE(e.code().category() == std::system_category());
		EXPECT_EQ(e.code().value(), ENOSPC);
		EXPECT_TRUE(IsErrno(e, ENOSPC));
		EXPECT_NE(strstr(e.what(), "Failed to write"), nullptr);
	}
}

TEST(ResultOrErrno, SystemCall)
{
	char buffer[16];
	const auto fd = FileDescriptor::Undefined();

	try {
		ResultOrErrno(fd.Read(buffer, sizeof(buffer)), "Failed to read");
		FAIL();
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsErrno(e, EBADF));
	}
}

TEST(CopyError, Category)
{
	EXPECT_STREQ(CopyErrorCategory().name(), "copy");

	const std::error_code code = CopyErrc::UNSUPPORTED;
	EXPECT_TRUE(code.category() == CopyErrorCategory());
	EXPECT_EQ(code.message(), "Operation not supported");
	EXPECT_NE(code, std::error_code(ENOTSUP, std::system_category()));

	EXPECT_EQ(make_error_code(CopyErrc::SOURCE_EXHAUSTED).message(),
		  "Source file ended prematurely");
}

TEST(CopyError, Throw)
{
	try {
		throw CopyError{CopyErrc::DESTINATION_INCOMPLETE, "Short write"};
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsCopyError(e, CopyErrc::DESTINATION_INCOMPLETE));
		EXPECT_FALSE(IsCopyError(e, CopyErrc::DESTINATION_FAILED));
		EXPECT_FALSE(IsUnsupported(e));
		EXPECT_NE(strstr(e.what(), "Short write"), nullptr);
	}
}

TEST(CopyError, IsUnsupported)
{
	EXPECT_TRUE(IsUnsupported(std::make_exception_ptr(CopyError{CopyErrc::UNSUPPORTED})));
	EXPECT_FALSE(IsUnsupported(std::make_exception_ptr(CopyError{CopyErrc::SOURCE_EXHAUSTED})));
	EXPECT_FALSE(IsUnsupported(std::make_exception_ptr(std::runtime_error{"foo"})));
	EXPECT_FALSE(IsUnsupported(std::make_exception_ptr(MakeErrno(EOPNOTSUPP, "foo"))));
	EXPECT_FALSE(IsUnsupported(std::make_exception_ptr(42)));
}
