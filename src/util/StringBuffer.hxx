// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <array>
#include <string_view>

/**
 * A statically allocated string buffer.
 */
template<std::size_t CAPACITY>
class StringBuffer {
	using Array = std::array<char, CAPACITY>;
	Array the_data;

public:
	using value_type = char;
	using reference = char &;
	using pointer = char *;
	using const_pointer = const char *;
	using iterator = pointer;
	using const_iterator = const_pointer;
	using size_type = std::size_t;

	static constexpr char SENTINEL = '\0';

	static_assert(CAPACITY > 0);

	constexpr size_type capacity() const noexcept {
		return CAPACITY;
	}

	constexpr bool empty() const noexcept {
		return front() == SENTINEL;
	}

	constexpr void clear() noexcept {
		the_data[0] = SENTINEL;
	}

	constexpr const_pointer c_str() const noexcept {
		return the_data.data();
	}

	constexpr pointer data() noexcept {
		return the_data.data();
	}

	constexpr char front() const noexcept {
		return c_str()[0];
	}

	constexpr operator std::string_view() const noexcept {
		return c_str();
	}

	constexpr iterator begin() noexcept {
		return data();
	}

	constexpr iterator end() noexcept {
		return begin() + capacity();
	}

	constexpr const_iterator begin() const noexcept {
		return c_str();
	}

	constexpr const_iterator end() const noexcept {
		return begin() + capacity();
	}
};
