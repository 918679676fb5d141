/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-12
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstring>
#include <limits>
#include <type_traits>

#include "jce/core/bytes.hpp"

namespace jce::core::byteorder {

	// Wire byte order. Big endian is the JCE default.
	enum class endian_mode : std::uint8_t {
		big = 0,
		little = 1,
	};

	template <typename T>
	concept UnsignedWord = std::is_unsigned_v<T> &&
		((sizeof(T) == 1) || (sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept SignedWord = std::is_signed_v<T> && std::is_integral_v<T> &&
		((sizeof(T) == 1) || (sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept Word = SignedWord<T> || UnsignedWord<T>;

	template <typename T>
	concept FloatWord = std::is_floating_point_v<T> &&
		((sizeof(T) == 4) || (sizeof(T) == 8));

	template <UnsignedWord WordT>
	constexpr inline WordT le_to_native_unsigned(const core::byte* mem) {
		WordT result = 0;
		for (std::size_t i = 0; i < sizeof(WordT); ++i) {
			result |= static_cast<WordT>(static_cast<WordT>(mem[i]) << (8 * i));
		}
		return result;
	}

	template <UnsignedWord WordT>
	constexpr inline WordT be_to_native_unsigned(const core::byte* mem) {
		WordT result = 0;
		for (std::size_t i = 0; i < sizeof(WordT); ++i) {
			result = static_cast<WordT>((static_cast<std::uint64_t>(result) << 8) | static_cast<std::uint64_t>(mem[i]));
		}
		return result;
	}

	template <UnsignedWord WordT>
	constexpr inline void native_to_le_unsigned(WordT val, core::byte* mem) {
		for (std::size_t i = 0; i < sizeof(WordT); ++i) {
			mem[i] = static_cast<core::byte>((val >> (8 * i)) & 0xFF);
		}
	}

	template <UnsignedWord WordT>
	constexpr inline void native_to_be_unsigned(WordT val, core::byte* mem) {
		for (std::size_t i = 0; i < sizeof(WordT); ++i) {
			mem[sizeof(WordT) - 1 - i] = static_cast<core::byte>((val >> (8 * i)) & 0xFF);
		}
	}

	template <Word WordT>
	constexpr inline WordT load(const core::byte* mem, endian_mode order) {
		using unsigned_type = std::make_unsigned_t<WordT>;
		const unsigned_type uns = (order == endian_mode::little)
			? le_to_native_unsigned<unsigned_type>(mem)
			: be_to_native_unsigned<unsigned_type>(mem);
		return std::bit_cast<WordT>(uns);
	}

	template <Word WordT>
	constexpr inline void store(WordT val, core::byte* mem, endian_mode order) {
		using unsigned_type = std::make_unsigned_t<WordT>;
		const auto uns = std::bit_cast<unsigned_type>(val);
		if (order == endian_mode::little) {
			native_to_le_unsigned<unsigned_type>(uns, mem);
		}
		else {
			native_to_be_unsigned<unsigned_type>(uns, mem);
		}
	}

	template <FloatWord FloatT>
	constexpr inline FloatT load_float(const core::byte* mem, endian_mode order) {
		using bits_type = std::conditional_t<sizeof(FloatT) == 4, std::uint32_t, std::uint64_t>;
		return std::bit_cast<FloatT>(load<bits_type>(mem, order));
	}

	template <FloatWord FloatT>
	constexpr inline void store_float(FloatT val, core::byte* mem, endian_mode order) {
		using bits_type = std::conditional_t<sizeof(FloatT) == 4, std::uint32_t, std::uint64_t>;
		store<bits_type>(std::bit_cast<bits_type>(val), mem, order);
	}

	// Appends the encoded word to the end of a growable buffer.
	template <Word WordT>
	inline void append(core::byte_buffer& out, WordT val, endian_mode order) {
		const auto old_size = out.size();
		out.resize(old_size + sizeof(WordT));
		store<WordT>(val, out.data() + old_size, order);
	}

	template <FloatWord FloatT>
	inline void append_float(core::byte_buffer& out, FloatT val, endian_mode order) {
		const auto old_size = out.size();
		out.resize(old_size + sizeof(FloatT));
		store_float<FloatT>(val, out.data() + old_size, order);
	}

} // namespace jce::core::byteorder
