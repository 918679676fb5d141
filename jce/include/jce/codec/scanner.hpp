/*
 * File: scanner.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-13
 * License: MIT
 */

#pragma once

#include <cstdint>

#include "jce/core/bytes.hpp"
#include "jce/core/byteorder.hpp"
#include "jce/core/error.hpp"
#include "jce/codec/type_code.hpp"
#include "jce/codec/options.hpp"

namespace jce::codec {

	struct scan_status {
		bool ok = true;
		core::error_code code = core::error_code::custom;
		std::size_t offset = 0;

		explicit operator bool() const noexcept { return ok; }
	};

	// Structural validator over the same grammar the reader skips. It never
	// allocates and never throws, so the generic decoder can probe opaque
	// byte blobs cheaply.
	class scanner {
	public:

		explicit scanner(byte_view data, endian_mode order = endian_mode::big) noexcept
			: data_(data)
			, order_(order)
		{}

		bool is_end() const noexcept { return pos_ >= data_.size(); }
		std::size_t position() const noexcept { return pos_; }
		const scan_status& status() const noexcept { return status_; }

		// Walks fields until StructEnd or end of input. Running out of input
		// is only acceptable at the outermost level.
		bool validate_struct() noexcept {
			if (depth_ > max_depth) {
				return fail(core::error_code::depth_exceeded, pos_);
			}
			++depth_;
			while (!is_end()) {
				type_code type{};
				if (!read_head(type)) {
					return false;
				}
				if (type == type_code::struct_end) {
					--depth_;
					return true;
				}
				if (!skip_field(type)) {
					return false;
				}
			}
			if (depth_ == 1) {
				--depth_;
				return true;
			}
			return fail(core::error_code::buffer_overflow, pos_);
		}

		// validate_struct() plus "nothing left over".
		bool validate_all() noexcept {
			return validate_struct() && (is_end() || fail(core::error_code::custom, pos_));
		}

	private:

		bool fail(core::error_code code, std::size_t offset) noexcept {
			status_.ok = false;
			status_.code = code;
			status_.offset = offset;
			return false;
		}

		bool read_u8(std::uint8_t& out) noexcept {
			if (is_end()) {
				return fail(core::error_code::buffer_overflow, pos_);
			}
			out = core::to_u8(data_[pos_++]);
			return true;
		}

		template <core::byteorder::Word WordT>
		bool read_word(WordT& out) noexcept {
			if (data_.size() - pos_ < sizeof(WordT)) {
				return fail(core::error_code::buffer_overflow, pos_);
			}
			out = core::byteorder::load<WordT>(data_.data() + pos_, order_);
			pos_ += sizeof(WordT);
			return true;
		}

		bool skip(std::size_t len) noexcept {
			if (data_.size() - pos_ < len) {
				return fail(core::error_code::buffer_overflow, pos_);
			}
			pos_ += len;
			return true;
		}

		bool read_head(type_code& type) noexcept {
			const std::size_t start = pos_;
			std::uint8_t b = 0;
			if (!read_u8(b)) {
				return false;
			}
			if (((b & 0xF0) >> 4) == 15) {
				std::uint8_t tag = 0;
				if (!read_u8(tag)) {
					return false;
				}
			}
			const auto maybe = to_type_code(b & 0x0F);
			if (!maybe) {
				return fail(core::error_code::invalid_type, start);
			}
			type = *maybe;
			return true;
		}

		bool read_size(std::size_t& size) noexcept {
			type_code type{};
			if (!read_head(type)) {
				return false;
			}
			std::int64_t val = 0;
			switch (type) {
			case type_code::zero_tag:
				break;
			case type_code::int1: {
				std::int8_t v = 0;
				if (!read_word(v)) return false;
				val = v;
				break;
			}
			case type_code::int2: {
				std::int16_t v = 0;
				if (!read_word(v)) return false;
				val = v;
				break;
			}
			case type_code::int4: {
				std::int32_t v = 0;
				if (!read_word(v)) return false;
				val = v;
				break;
			}
			default:
				return fail(core::error_code::custom, pos_);
			}
			if (val < 0) {
				return fail(core::error_code::custom, pos_);
			}
			size = static_cast<std::size_t>(val);
			return true;
		}

		bool skip_field(type_code type) noexcept {
			switch (type) {
			case type_code::int1:   return skip(1);
			case type_code::int2:   return skip(2);
			case type_code::int4:   return skip(4);
			case type_code::int8:   return skip(8);
			case type_code::fp32:   return skip(4);
			case type_code::fp64:   return skip(8);
			case type_code::string1: {
				std::uint8_t len = 0;
				return read_u8(len) && skip(len);
			}
			case type_code::string4: {
				std::uint32_t len = 0;
				return read_word(len) && skip(len);
			}
			case type_code::map: {
				std::size_t size = 0;
				if (!read_size(size)) {
					return false;
				}
				for (std::size_t i = 0; i < size * 2; ++i) {
					type_code inner{};
					if (!read_head(inner) || !skip_nested(inner)) {
						return false;
					}
				}
				return true;
			}
			case type_code::list: {
				std::size_t size = 0;
				if (!read_size(size)) {
					return false;
				}
				for (std::size_t i = 0; i < size; ++i) {
					type_code inner{};
					if (!read_head(inner) || !skip_nested(inner)) {
						return false;
					}
				}
				return true;
			}
			case type_code::simple_list: {
				std::uint8_t elem = 0;
				if (!read_u8(elem)) {
					return false;
				}
				if (elem != to_u8(type_code::int1)) {
					return fail(core::error_code::custom, pos_);
				}
				std::size_t len = 0;
				return read_size(len) && skip(len);
			}
			case type_code::struct_begin:
				return validate_struct();
			case type_code::struct_end:
			case type_code::zero_tag:
				return true;
			}
			return fail(core::error_code::invalid_type, pos_);
		}

		// Container elements count against the same depth cap as structs.
		bool skip_nested(type_code type) noexcept {
			if (depth_ > max_depth) {
				return fail(core::error_code::depth_exceeded, pos_);
			}
			++depth_;
			const bool ok = skip_field(type);
			--depth_;
			return ok;
		}

		byte_view data_;
		std::size_t pos_ = 0;
		endian_mode order_ = endian_mode::big;
		std::size_t depth_ = 0;
		scan_status status_{};
	};

} // namespace jce::codec
