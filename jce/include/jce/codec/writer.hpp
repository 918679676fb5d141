/*
 * File: writer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-12
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <format>
#include <limits>
#include <string_view>
#include <utility>

#include "jce/core/bytes.hpp"
#include "jce/core/byteorder.hpp"
#include "jce/core/error.hpp"
#include "jce/codec/type_code.hpp"
#include "jce/codec/head.hpp"

namespace jce::codec {

	using core::byteorder::endian_mode;

	// String1 up to 255 bytes, String4 up to the 32-bit length limit.
	inline type_code string_type_for(std::size_t len, std::size_t offset = 0) {
		if (len <= std::numeric_limits<std::uint8_t>::max()) {
			return type_code::string1;
		}
		if (len > std::numeric_limits<std::uint32_t>::max()) {
			throw core::codec_error(offset, std::format("String length {} exceeds the String4 limit", len));
		}
		return type_code::string4;
	}

	// Append-only TLV encoder. Values are validated by the layers above
	// before they get here; only an oversized string is rejected.
	class writer {
	public:

		static constexpr std::size_t initial_capacity = 128;

		explicit writer(endian_mode order = endian_mode::big)
			: order_(order)
		{
			buffer_.reserve(initial_capacity);
		}

		writer(writer&&) = default;
		writer& operator = (writer&&) = default;
		writer(const writer&) = delete;
		writer& operator = (const writer&) = delete;

		endian_mode order() const noexcept { return order_; }
		void set_order(endian_mode order) noexcept { order_ = order; }

		writer& write_tag(std::uint8_t tag, type_code type) {
			append_head(buffer_, tag, type);
			return *this;
		}

		// Narrowest representation: 0 has no payload at all.
		writer& write_int(std::uint8_t tag, std::int64_t value) {
			if (value == 0) {
				write_tag(tag, type_code::zero_tag);
			}
			else if (fits<std::int8_t>(value)) {
				write_tag(tag, type_code::int1);
				buffer_.push_back(static_cast<byte>(static_cast<std::uint8_t>(value)));
			}
			else if (fits<std::int16_t>(value)) {
				write_tag(tag, type_code::int2);
				core::byteorder::append<std::int16_t>(buffer_, static_cast<std::int16_t>(value), order_);
			}
			else if (fits<std::int32_t>(value)) {
				write_tag(tag, type_code::int4);
				core::byteorder::append<std::int32_t>(buffer_, static_cast<std::int32_t>(value), order_);
			}
			else {
				write_tag(tag, type_code::int8);
				core::byteorder::append<std::int64_t>(buffer_, value, order_);
			}
			return *this;
		}

		writer& write_float(std::uint8_t tag, float value) {
			write_tag(tag, type_code::fp32);
			core::byteorder::append_float<float>(buffer_, value, order_);
			return *this;
		}

		writer& write_double(std::uint8_t tag, double value) {
			write_tag(tag, type_code::fp64);
			core::byteorder::append_float<double>(buffer_, value, order_);
			return *this;
		}

		writer& write_string(std::uint8_t tag, std::string_view value) {
			const auto len = value.size();
			if (string_type_for(len, buffer_.size()) == type_code::string1) {
				write_tag(tag, type_code::string1);
				buffer_.push_back(static_cast<byte>(static_cast<std::uint8_t>(len)));
			}
			else {
				write_tag(tag, type_code::string4);
				core::byteorder::append<std::uint32_t>(buffer_, static_cast<std::uint32_t>(len), order_);
			}
			return append(core::as_bytes(value));
		}

		// SimpleList: element type byte (always Int1 = "byte"), count as an
		// integer field under tag 0, raw payload.
		writer& write_bytes(std::uint8_t tag, byte_view value) {
			write_tag(tag, type_code::simple_list);
			buffer_.push_back(static_cast<byte>(to_u8(type_code::int1)));
			write_int(0, static_cast<std::int64_t>(value.size()));
			return append(value);
		}

		writer& write_struct_begin(std::uint8_t tag) {
			return write_tag(tag, type_code::struct_begin);
		}

		writer& write_struct_end() {
			return write_tag(0, type_code::struct_end);
		}

		writer& append(byte_view data) {
			if (!data.empty()) {
				const auto old_size = buffer_.size();
				buffer_.resize(old_size + data.size());
				std::memcpy(&buffer_[old_size], data.data(), data.size());
			}
			return *this;
		}

		void clear() noexcept {
			buffer_.clear();
		}

		std::size_t size() const noexcept {
			return buffer_.size();
		}

		const byte* data() const noexcept { return buffer_.data(); }

		byte_view view() const noexcept {
			return byte_view(buffer_.data(), buffer_.size());
		}

		byte_buffer release() {
			byte_buffer out = std::move(buffer_);
			buffer_ = byte_buffer{};
			buffer_.reserve(initial_capacity);
			return out;
		}

	private:

		template <typename NarrowT>
		static constexpr bool fits(std::int64_t value) noexcept {
			return value >= std::numeric_limits<NarrowT>::min()
				&& value <= std::numeric_limits<NarrowT>::max();
		}

		byte_buffer buffer_;
		endian_mode order_ = endian_mode::big;
	};

} // namespace jce::codec
