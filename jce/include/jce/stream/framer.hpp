/*
 * File: framer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-16
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <limits>
#include <optional>

#include "jce/core/bytes.hpp"
#include "jce/core/byteorder.hpp"
#include "jce/core/error.hpp"
#include "jce/stream/frame_settings.hpp"

namespace jce::stream {

	using core::byte_buffer;
	using core::byte_view;
	using core::byteorder::endian_mode;

	// Length-prefixed packet boundaries over an accumulation buffer.
	class framer {
	public:

		explicit framer(frame_settings settings = {})
			: settings_(settings)
		{
			settings_.validate();
		}

		const frame_settings& settings() const noexcept { return settings_; }
		std::size_t header_size() const noexcept { return settings_.length_width; }

		// nullopt while more bytes are needed, otherwise the size of the first
		// complete packet including its length field.
		std::optional<std::size_t> check_frame(byte_view buffer) const {
			const auto header_len = header_size();
			if (buffer.size() < header_len) {
				return std::nullopt;
			}
			const auto length = read_length(buffer);
			const std::size_t packet_size = settings_.inclusive_length ? length : length + header_len;
			if (settings_.inclusive_length && packet_size < header_len) {
				throw core::frame_error::invalid_length(packet_size, header_len);
			}
			if (packet_size > settings_.max_frame_size) {
				throw core::frame_error::too_large(packet_size, settings_.max_frame_size);
			}
			if (buffer.size() < packet_size) {
				return std::nullopt;
			}
			return packet_size;
		}

		// Length field for a body of body_size bytes, appended to out.
		void append_header(byte_buffer& out, std::size_t body_size) const {
			const auto header_len = header_size();
			const std::size_t packet_size = body_size + header_len;
			const std::size_t length = settings_.inclusive_length ? packet_size : body_size;
			if (packet_size > settings_.max_frame_size) {
				throw core::frame_error::too_large(packet_size, settings_.max_frame_size);
			}
			if (length > max_length()) {
				throw core::frame_error::too_large(length, max_length());
			}
			const auto order = length_order();
			switch (header_len) {
			case 1:
				out.push_back(static_cast<core::byte>(length));
				break;
			case 2:
				core::byteorder::append<std::uint16_t>(out, static_cast<std::uint16_t>(length), order);
				break;
			default:
				core::byteorder::append<std::uint32_t>(out, static_cast<std::uint32_t>(length), order);
				break;
			}
		}

	private:

		endian_mode length_order() const noexcept {
			return settings_.little_endian_length ? endian_mode::little : endian_mode::big;
		}

		std::size_t max_length() const noexcept {
			switch (header_size()) {
			case 1: return std::numeric_limits<std::uint8_t>::max();
			case 2: return std::numeric_limits<std::uint16_t>::max();
			default: return std::numeric_limits<std::uint32_t>::max();
			}
		}

		std::size_t read_length(byte_view buffer) const {
			const auto order = length_order();
			switch (header_size()) {
			case 1:
				return core::to_u8(buffer[0]);
			case 2:
				return core::byteorder::load<std::uint16_t>(buffer.data(), order);
			default:
				return core::byteorder::load<std::uint32_t>(buffer.data(), order);
			}
		}

		frame_settings settings_;
	};

	inline byte_buffer encode_frame(byte_view body, const frame_settings& settings = {}) {
		const framer f(settings);
		byte_buffer out;
		out.reserve(body.size() + f.header_size());
		f.append_header(out, body.size());
		out.insert(out.end(), body.begin(), body.end());
		return out;
	}

} // namespace jce::stream
