// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/Exception.hxx"
#include "io/copy/CopyError.hxx"
#include "system/Error.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ExceptionTest, RuntimeError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, Empty)
{
	ASSERT_EQ(GetFullMessage(std::exception_ptr{}), "Unknown exception");
}

TEST(ExceptionTest, Nested)
{
	std::exception_ptr ep;

	try {
		try {
			throw MakeErrno(ENOENT, "Failed to open 'foo'");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("Failed to copy 'foo'"));
		}
	} catch (...) {
		ep = std::current_exception();
	}

	const std::string msg = GetFullMessage(ep);
	ASSERT_EQ(msg.rfind("Failed to copy 'foo'; Failed to open 'foo': ", 0), 0U);

	ASSERT_EQ(GetFullMessage(ep, "X", " / ").rfind("Failed to copy 'foo' / ", 0), 0U);
}

TEST(ExceptionTest, CopyError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(CopyError{CopyErrc::SOURCE_EXHAUSTED})),
		  "Source file ended prematurely");
}
