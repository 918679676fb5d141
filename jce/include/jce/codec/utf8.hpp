/*
 * File: utf8.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-13
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>

#include "jce/core/bytes.hpp"

namespace jce::codec::utf8 {

	using core::byte_view;

	// Offset of the first byte that breaks well-formed UTF-8 (RFC 3629:
	// no overlongs, no surrogates, nothing above U+10FFFF), or nullopt.
	inline std::optional<std::size_t> first_invalid(byte_view data) noexcept {
		std::size_t i = 0;
		const std::size_t n = data.size();
		while (i < n) {
			const auto c = core::to_u8(data[i]);
			if (c < 0x80) {
				++i;
				continue;
			}

			std::size_t extra = 0;
			std::uint8_t lo = 0x80;
			std::uint8_t hi = 0xBF;

			if (c >= 0xC2 && c <= 0xDF) {
				extra = 1;
			}
			else if (c == 0xE0) {
				extra = 2; lo = 0xA0;
			}
			else if (c == 0xED) {
				extra = 2; hi = 0x9F;
			}
			else if (c >= 0xE1 && c <= 0xEF) {
				extra = 2;
			}
			else if (c == 0xF0) {
				extra = 3; lo = 0x90;
			}
			else if (c == 0xF4) {
				extra = 3; hi = 0x8F;
			}
			else if (c >= 0xF1 && c <= 0xF3) {
				extra = 3;
			}
			else {
				return i;
			}

			if (i + extra >= n) {
				return i;
			}
			const auto second = core::to_u8(data[i + 1]);
			if (second < lo || second > hi) {
				return i;
			}
			for (std::size_t k = 2; k <= extra; ++k) {
				const auto cont = core::to_u8(data[i + k]);
				if (cont < 0x80 || cont > 0xBF) {
					return i;
				}
			}
			i += extra + 1;
		}
		return std::nullopt;
	}

	inline bool is_valid(byte_view data) noexcept {
		return !first_invalid(data).has_value();
	}

	// Human readable text: no control bytes other than \t \n \r, no DEL, and
	// well-formed UTF-8.
	inline bool is_safe_text(byte_view data) noexcept {
		for (auto b : data) {
			const auto c = core::to_u8(b);
			if (c < 32) {
				if (c != '\t' && c != '\n' && c != '\r') {
					return false;
				}
			}
			else if (c == 127) {
				return false;
			}
		}
		return is_valid(data);
	}

} // namespace jce::codec::utf8
