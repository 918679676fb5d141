/*
 * File: decoder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-15
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "jce/core/bytes.hpp"
#include "jce/core/error.hpp"
#include "jce/core/log.hpp"
#include "jce/codec/type_code.hpp"
#include "jce/codec/options.hpp"
#include "jce/codec/depth_guard.hpp"
#include "jce/codec/reader.hpp"
#include "jce/codec/scanner.hpp"
#include "jce/codec/utf8.hpp"
#include "jce/codec/value.hpp"
#include "jce/codec/schema.hpp"

namespace jce::codec {

	// Materializes values from a reader. Schema-driven fields whose wire type
	// does not match the declaration fall back to the generic path.
	class decoder {
	public:

		explicit decoder(reader& in, bytes_mode mode = bytes_mode::automatic)
			: in_(in)
			, mode_(mode)
		{}

		bytes_mode mode() const noexcept { return mode_; }

		// Fields up to StructEnd or the end of input.
		value::record decode_record() {
			depth_guard guard(depth_, in_.position());
			value::record out;
			while (!in_.is_end()) {
				const auto head = in_.read_head();
				if (head.type == type_code::struct_end) {
					break;
				}
				out.set(head.tag, decode_generic_field(head.type));
			}
			return out;
		}

		value decode_generic_field(type_code type) {
			switch (type) {
			case type_code::int1:
			case type_code::int2:
			case type_code::int4:
			case type_code::int8:
			case type_code::zero_tag:
				return value(in_.read_int(type));
			case type_code::fp32:
				return value(static_cast<double>(in_.read_float()));
			case type_code::fp64:
				return value(in_.read_double());
			case type_code::string1:
			case type_code::string4:
				return value(std::string(in_.read_string(type)));
			case type_code::map:
				return decode_map();
			case type_code::list:
				return decode_list();
			case type_code::simple_list:
				return decode_blob();
			case type_code::struct_begin:
				return value(decode_record());
			case type_code::struct_end:
				break;
			}
			return value{};
		}

		// Decoded fields as a name -> value map in declaration order; fields
		// missing from the wire take their declared default.
		value decode_struct(const compiled_schema& schema) {
			auto slots = decode_slots(schema);
			value::map out;
			out.reserve(schema.size());
			const auto& fields = schema.fields();
			for (std::size_t i = 0; i < fields.size(); ++i) {
				out.emplace_back(value(fields[i].name),
					slots[i] ? std::move(*slots[i]) : fields[i].default_value);
			}
			return value(std::move(out));
		}

		void decode_struct_into(const compiled_schema& schema, field_accessor& target) {
			auto slots = decode_slots(schema);
			const auto& fields = schema.fields();
			for (std::size_t i = 0; i < fields.size(); ++i) {
				target.set(fields[i].name, slots[i] ? std::move(*slots[i]) : fields[i].default_value);
			}
		}

		value decode_typed_field(const field_descriptor& field, type_code wire) {
			if (field.infers_type() || !is_compatible(field.declared_type(), wire)) {
				return decode_generic_field(wire);
			}
			switch (field.declared_type()) {
			case type_code::int1:
			case type_code::int2:
			case type_code::int4:
			case type_code::int8:
				return value(in_.read_int(wire));
			case type_code::fp32:
				return value(static_cast<double>(in_.read_float()));
			case type_code::fp64:
				if (wire == type_code::fp32) {
					return value(static_cast<double>(in_.read_float()));
				}
				return value(in_.read_double());
			case type_code::string1:
			case type_code::string4:
				return value(std::string(in_.read_string(wire)));
			case type_code::map:
				return decode_map();
			case type_code::list:
				return decode_list();
			case type_code::simple_list:
				return value::from_bytes(read_simple_list());
			case type_code::struct_begin:
				if (field.nested) {
					return decode_struct(*field.nested);
				}
				return value(decode_record());
			case type_code::zero_tag:
				return value(0);
			case type_code::struct_end:
				break;
			}
			return value{};
		}

	private:

		std::vector<std::optional<value>> decode_slots(const compiled_schema& schema) {
			depth_guard guard(depth_, in_.position());
			std::vector<std::optional<value>> slots(schema.size());
			while (!in_.is_end()) {
				const auto head = in_.read_head();
				if (head.type == type_code::struct_end) {
					break;
				}
				if (auto idx = schema.index_of(head.tag)) {
					slots[*idx] = decode_typed_field(schema.fields()[*idx], head.type);
				}
				else {
					in_.skip_field(head.type);
				}
			}
			return slots;
		}

		value decode_map() {
			depth_guard guard(depth_, in_.position());
			const auto size = in_.read_size();
			value::map out;
			out.reserve(std::min<std::size_t>(size, in_.remaining()));
			for (std::size_t i = 0; i < size; ++i) {
				auto k = decode_generic_field(in_.read_head().type);
				auto v = decode_generic_field(in_.read_head().type);
				out.emplace_back(std::move(k), std::move(v));
			}
			return value(std::move(out));
		}

		value decode_list() {
			depth_guard guard(depth_, in_.position());
			const auto size = in_.read_size();
			value::list out;
			out.reserve(std::min<std::size_t>(size, in_.remaining()));
			for (std::size_t i = 0; i < size; ++i) {
				out.push_back(decode_generic_field(in_.read_head().type));
			}
			return value(std::move(out));
		}

		byte_view read_simple_list() {
			in_.read_simple_list_marker();
			return in_.read_bytes(in_.read_size());
		}

		value decode_blob() {
			const auto bytes = read_simple_list();
			switch (mode_) {
			case bytes_mode::raw:
				break;
			case bytes_mode::string:
				if (utf8::is_valid(bytes)) {
					return value(std::string(core::as_chars(bytes)));
				}
				break;
			case bytes_mode::automatic:
				if (utf8::is_safe_text(bytes)) {
					return value(std::string(core::as_chars(bytes)));
				}
				if (auto nested = probe_struct(bytes)) {
					return value(std::move(*nested));
				}
				break;
			}
			return value::from_bytes(bytes);
		}

		// A blob that scans as exactly one struct body decodes as a record;
		// any failure leaves it as raw bytes.
		std::optional<value::record> probe_struct(byte_view bytes) {
			scanner probe(bytes, in_.order());
			if (!probe.validate_all()) {
				return std::nullopt;
			}
			reader nested_in(bytes, in_.order());
			decoder nested(nested_in, mode_);
			nested.depth_ = depth_ + 1;
			try {
				return nested.decode_record();
			}
			catch (const core::codec_error& e) {
				core::logger().debug("nested struct probe fell back to bytes: {}", e.what());
			}
			return std::nullopt;
		}

		reader& in_;
		bytes_mode mode_;
		std::size_t depth_ = 0;
	};

} // namespace jce::codec
