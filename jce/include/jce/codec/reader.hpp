/*
 * File: reader.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-12
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <string_view>
#include <format>

#include "jce/core/bytes.hpp"
#include "jce/core/byteorder.hpp"
#include "jce/core/error.hpp"
#include "jce/codec/type_code.hpp"
#include "jce/codec/head.hpp"
#include "jce/codec/options.hpp"
#include "jce/codec/depth_guard.hpp"
#include "jce/codec/utf8.hpp"

namespace jce::codec {

	// Cursor over a caller-owned buffer. Strings and byte payloads are
	// returned as views into that buffer; it must outlive the results.
	class reader {
	public:

		explicit reader(byte_view data, endian_mode order = endian_mode::big) noexcept
			: data_(data)
			, order_(order)
		{}

		std::size_t position() const noexcept { return pos_; }
		std::size_t remaining() const noexcept { return data_.size() - pos_; }
		bool is_end() const noexcept { return pos_ >= data_.size(); }
		endian_mode order() const noexcept { return order_; }
		byte_view data() const noexcept { return data_; }

		field_head read_head() {
			return parse_head(data_, pos_);
		}

		field_head peek_head() const {
			std::size_t probe = pos_;
			return parse_head(data_, probe);
		}

		std::uint8_t read_u8() {
			require(1);
			return core::to_u8(data_[pos_++]);
		}

		std::int64_t read_int(type_code type) {
			switch (type) {
			case type_code::zero_tag:
				return 0;
			case type_code::int1:
				return read_word<std::int8_t>();
			case type_code::int2:
				return read_word<std::int16_t>();
			case type_code::int4:
				return read_word<std::int32_t>();
			case type_code::int8:
				return read_word<std::int64_t>();
			default:
				throw core::codec_error(pos_, std::format("Cannot read int from type {}", type_code_name(type)));
			}
		}

		float read_float() {
			require(sizeof(float));
			const auto val = core::byteorder::load_float<float>(data_.data() + pos_, order_);
			pos_ += sizeof(float);
			return val;
		}

		double read_double() {
			require(sizeof(double));
			const auto val = core::byteorder::load_float<double>(data_.data() + pos_, order_);
			pos_ += sizeof(double);
			return val;
		}

		// Zero-copy; the bytes must be valid UTF-8.
		std::string_view read_string(type_code type) {
			const std::size_t start = pos_;
			std::size_t len = 0;
			switch (type) {
			case type_code::string1:
				len = read_u8();
				break;
			case type_code::string4:
				len = read_word<std::uint32_t>();
				break;
			default:
				throw core::codec_error(start, std::format("Cannot read string from type {}", type_code_name(type)));
			}

			const std::size_t body = pos_;
			if (len > remaining()) {
				pos_ = start;
				throw core::buffer_overflow_error(body);
			}
			const auto slice = data_.subspan(body, len);
			if (auto bad = utf8::first_invalid(slice)) {
				pos_ = start;
				throw core::codec_error(body, std::format("Invalid UTF-8 string: invalid byte at index {}", *bad));
			}
			pos_ = body + len;
			return core::as_chars(slice);
		}

		byte_view read_bytes(std::size_t len) {
			require(len);
			const auto slice = data_.subspan(pos_, len);
			pos_ += len;
			return slice;
		}

		// Container counts (Map/List/SimpleList) are integer fields under tag 0,
		// at most Int4 wide.
		std::size_t read_size() {
			const auto head = read_head();
			const std::size_t at = pos_;
			if (head.type == type_code::int8) {
				throw core::codec_error(at, "Container length does not fit Int4");
			}
			const auto size = read_int(head.type);
			if (size < 0) {
				throw core::codec_error(at, std::format("Container length cannot be negative: {}", size));
			}
			return static_cast<std::size_t>(size);
		}

		// SimpleList element type byte, which must be Int1 ("byte").
		void read_simple_list_marker() {
			const std::size_t at = pos_;
			const auto elem = read_u8();
			if (elem != to_u8(type_code::int1)) {
				throw core::codec_error(at, std::format("SimpleList must contain Byte (0), got {}", elem));
			}
		}

		// Structural skip of one field body of the given type.
		void skip_field(type_code type) {
			depth_guard guard(depth_, pos_);
			do_skip_field(type);
		}

	private:

		void do_skip_field(type_code type) {
			switch (type) {
			case type_code::int1:   skip(1); break;
			case type_code::int2:   skip(2); break;
			case type_code::int4:   skip(4); break;
			case type_code::int8:   skip(8); break;
			case type_code::fp32:   skip(4); break;
			case type_code::fp64:   skip(8); break;
			case type_code::string1:
				skip(read_u8());
				break;
			case type_code::string4:
				skip(read_word<std::uint32_t>());
				break;
			case type_code::map: {
				const auto size = read_size();
				for (std::size_t i = 0; i < size; ++i) {
					skip_field(read_head().type);
					skip_field(read_head().type);
				}
				break;
			}
			case type_code::list: {
				const auto size = read_size();
				for (std::size_t i = 0; i < size; ++i) {
					skip_field(read_head().type);
				}
				break;
			}
			case type_code::simple_list:
				read_simple_list_marker();
				skip(read_size());
				break;
			case type_code::struct_begin:
				while (true) {
					const auto head = read_head();
					if (head.type == type_code::struct_end) {
						break;
					}
					skip_field(head.type);
				}
				break;
			case type_code::struct_end:
			case type_code::zero_tag:
				break;
			}
		}

		void require(std::size_t len) const {
			if (len > remaining()) {
				throw core::buffer_overflow_error(pos_);
			}
		}

		void skip(std::size_t len) {
			require(len);
			pos_ += len;
		}

		template <core::byteorder::Word WordT>
		WordT read_word() {
			require(sizeof(WordT));
			const auto val = core::byteorder::load<WordT>(data_.data() + pos_, order_);
			pos_ += sizeof(WordT);
			return val;
		}

		byte_view data_;
		std::size_t pos_ = 0;
		endian_mode order_ = endian_mode::big;
		std::size_t depth_ = 0;
	};

} // namespace jce::codec
