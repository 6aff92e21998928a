// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include <unistd.h>
#include <sys/types.h>

/**
 * An OO wrapper for a UNIX file descriptor.
 *
 * This class is unmanaged and trivial; for a managed version, see
 * #UniqueFileDescriptor.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;
	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool operator==(FileDescriptor other) const noexcept {
		return fd == other.fd;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Ask the kernel whether this is a regular file.
	 */
	[[gnu::pure]]
	bool IsRegularFile() const noexcept;

	/**
	 * Returns the file descriptor.  This may only be called if
	 * IsDefined() returns true.
	 */
	constexpr int Get() const noexcept {
		return fd;
	}

	constexpr void Set(int _fd) noexcept {
		fd = _fd;
	}

	constexpr int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	constexpr void SetUndefined() noexcept {
		fd = -1;
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	bool Open(FileDescriptor dir, const char *pathname,
		  int flags, mode_t mode=0666) noexcept;
	bool Open(const char *pathname, int flags, mode_t mode=0666) noexcept;

	bool OpenReadOnly(const char *pathname) noexcept;
	bool OpenReadOnly(FileDescriptor dir,
			  const char *pathname) noexcept;

	/**
	 * Close the file descriptor.  It should not be called on an
	 * "undefined" object.  After this call, IsDefined() is
	 * guaranteed to return false, and this object may be reused.
	 */
	bool Close() noexcept {
		return ::close(Steal()) == 0;
	}

	off_t Seek(off_t offset) noexcept {
		return lseek(Get(), offset, SEEK_SET);
	}

	[[gnu::pure]]
	off_t Tell() const noexcept {
		return lseek(Get(), 0, SEEK_CUR);
	}

	/**
	 * Returns the size of the file in bytes, or -1 on error.
	 */
	[[gnu::pure]]
	off_t GetSize() const noexcept;

	ssize_t Read(std::span<std::byte> dest) const noexcept {
		return ::read(fd, dest.data(), dest.size());
	}

	ssize_t Read(void *buffer, std::size_t length) const noexcept {
		return ::read(fd, buffer, length);
	}

	/**
	 * Read from the given offset without touching the file
	 * pointer (pread()).
	 */
	ssize_t ReadAt(off_t offset, std::span<std::byte> dest) const noexcept {
		return ::pread(fd, dest.data(), dest.size(), offset);
	}

	ssize_t Write(std::span<const std::byte> src) const noexcept {
		return ::write(fd, src.data(), src.size());
	}

	ssize_t Write(const void *buffer, std::size_t length) const noexcept {
		return ::write(fd, buffer, length);
	}

	/**
	 * Write at the given offset without touching the file
	 * pointer (pwrite()).
	 */
	ssize_t WriteAt(off_t offset, std::span<const std::byte> src) const noexcept {
		return ::pwrite(fd, src.data(), src.size(), offset);
	}

	bool TruncateWrite(off_t length) const noexcept {
		return ::ftruncate(fd, length) == 0;
	}
};
