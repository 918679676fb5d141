/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-12
 * License: MIT
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <span>
#include <string>
#include <string_view>
#include <initializer_list>

namespace jce::core {

	using byte = std::byte;
	using byte_buffer = std::vector<byte>;
	using byte_view = std::span<const byte>;

	inline byte_view as_bytes(std::string_view str) noexcept {
		return byte_view(reinterpret_cast<const byte*>(str.data()), str.size());
	}

	inline std::string_view as_chars(byte_view data) noexcept {
		return std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
	}

	inline byte_buffer to_buffer(byte_view data) {
		return byte_buffer(data.begin(), data.end());
	}

	inline byte_buffer to_buffer(std::string_view str) {
		const auto view = as_bytes(str);
		return byte_buffer(view.begin(), view.end());
	}

	// make_bytes({0x0D, 0x00, 0x03}) -- handy for literal wire fragments
	inline byte_buffer make_bytes(std::initializer_list<std::uint8_t> raw) {
		byte_buffer out;
		out.reserve(raw.size());
		for (auto b : raw) {
			out.push_back(static_cast<byte>(b));
		}
		return out;
	}

	constexpr inline std::uint8_t to_u8(byte b) noexcept {
		return static_cast<std::uint8_t>(b);
	}

} // namespace jce::core
