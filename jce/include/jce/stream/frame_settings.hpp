/*
 * File: frame_settings.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-16
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <format>
#include <stdexcept>

namespace jce::stream {

	// What the stream decoder does with a frame whose body fails to decode.
	enum class decode_failure_policy : std::uint8_t {
		retain = 0,   // keep the bytes; the same error repeats on the next call
		discard = 1,  // drop the frame, then report the error
	};

	struct frame_settings {
		std::size_t length_width = 4;
		bool inclusive_length = true;
		bool little_endian_length = false;
		std::size_t max_frame_size = 10 * 1024 * 1024;
		std::size_t max_buffer_size = 10 * 1024 * 1024;
		decode_failure_policy on_decode_error = decode_failure_policy::discard;

		constexpr bool has_valid_width() const noexcept {
			return length_width == 1 || length_width == 2 || length_width == 4;
		}

		void validate() const {
			if (!has_valid_width()) {
				throw std::invalid_argument(
					std::format("length width must be 1, 2, or 4, got {}", length_width));
			}
			if (max_frame_size > max_buffer_size) {
				throw std::invalid_argument(
					std::format("max frame size {} exceeds max buffer size {}", max_frame_size, max_buffer_size));
			}
		}
	};
	static_assert(frame_settings{}.has_valid_width(), "default width must be valid");
	static_assert(frame_settings{}.max_frame_size <= frame_settings{}.max_buffer_size, "a full frame must fit the buffer");

} // namespace jce::stream
