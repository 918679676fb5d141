/*
 * File: head.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-12
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstddef>

#include "jce/core/bytes.hpp"
#include "jce/core/error.hpp"
#include "jce/codec/type_code.hpp"

namespace jce::codec {

	using core::byte;
	using core::byte_buffer;
	using core::byte_view;

	// Tags below this value share the header byte with the type code.
	constexpr std::uint8_t extended_tag_marker = 15;

	struct field_head {
		std::uint8_t tag = 0;
		type_code type = type_code::int1;

		friend constexpr bool operator == (const field_head&, const field_head&) = default;
	};

	constexpr inline std::size_t head_size(std::uint8_t tag) noexcept {
		return tag < extended_tag_marker ? 1 : 2;
	}

	inline void append_head(byte_buffer& out, std::uint8_t tag, type_code type) {
		const auto type_val = to_u8(type);
		if (tag < extended_tag_marker) {
			out.push_back(static_cast<byte>((tag << 4) | type_val));
		}
		else {
			out.push_back(static_cast<byte>((extended_tag_marker << 4) | type_val));
			out.push_back(static_cast<byte>(tag));
		}
	}

	// Decodes the header at data[pos] and advances pos past it.
	// Throws buffer_overflow_error / invalid_type_error.
	inline field_head parse_head(byte_view data, std::size_t& pos) {
		const std::size_t start = pos;
		if (start >= data.size()) {
			throw core::buffer_overflow_error(start);
		}
		const auto b = core::to_u8(data[start]);
		const std::uint8_t type_id = b & 0x0F;
		std::uint8_t tag = static_cast<std::uint8_t>((b & 0xF0) >> 4);
		std::size_t next = start + 1;

		if (tag == extended_tag_marker) {
			if (next >= data.size()) {
				throw core::buffer_overflow_error(next);
			}
			tag = core::to_u8(data[next]);
			++next;
		}

		const auto type = to_type_code(type_id);
		if (!type) {
			throw core::invalid_type_error(start, type_id);
		}
		pos = next;
		return { tag, *type };
	}

} // namespace jce::codec
