/*
 * File: encoder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-15
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <format>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "jce/core/bytes.hpp"
#include "jce/core/error.hpp"
#include "jce/codec/type_code.hpp"
#include "jce/codec/options.hpp"
#include "jce/codec/depth_guard.hpp"
#include "jce/codec/writer.hpp"
#include "jce/codec/value.hpp"
#include "jce/codec/schema.hpp"

namespace jce::codec {

	namespace detail {

		// Per-thread output reused for nested SimpleList blobs. A re-entrant
		// user on the same thread gets a fresh writer instead.
		struct scratch_slot {
			writer out;
			bool busy = false;
		};

		inline scratch_slot& thread_scratch() {
			thread_local scratch_slot slot;
			return slot;
		}

		class scratch_lease {
		public:
			explicit scratch_lease(endian_mode order)
				: slot_(thread_scratch())
			{
				if (slot_.busy) {
					fallback_.emplace(order);
					return;
				}
				slot_.busy = true;
				slot_.out.clear();
				slot_.out.set_order(order);
				owned_ = true;
			}

			~scratch_lease() {
				if (owned_) {
					slot_.out.clear();
					slot_.busy = false;
				}
			}

			scratch_lease(const scratch_lease&) = delete;
			scratch_lease& operator = (const scratch_lease&) = delete;

			writer& get() noexcept { return owned_ ? slot_.out : *fallback_; }

		private:
			scratch_slot& slot_;
			std::optional<writer> fallback_;
			bool owned_ = false;
		};

		// Tag a map key stands for when the map is written as a struct:
		// integers 0..255, or text "N" / "N:name".
		inline std::optional<std::uint8_t> key_to_tag(const value& key) {
			if (key.is_int()) {
				const auto v = key.as_int();
				if (v >= 0 && v <= 255) {
					return static_cast<std::uint8_t>(v);
				}
				return std::nullopt;
			}
			if (!key.is_text()) {
				return std::nullopt;
			}
			std::string_view text = key.as_text();
			if (auto colon = text.find(':'); colon != std::string_view::npos) {
				text = text.substr(0, colon);
			}
			unsigned parsed = 0;
			const auto* first = text.data();
			const auto* last = text.data() + text.size();
			auto [ptr, ec] = std::from_chars(first, last, parsed);
			if (text.empty() || ec != std::errc{} || ptr != last || parsed > 255) {
				return std::nullopt;
			}
			return static_cast<std::uint8_t>(parsed);
		}
	}

	// Writes values into a writer, either by a compiled schema or by
	// inferring a wire type from the value kind.
	class encoder {
	public:

		explicit encoder(writer& out, codec_options opts = {})
			: out_(out)
			, opts_(opts)
		{}

		const codec_options& options() const noexcept { return opts_; }

		// Struct body (no StructBegin/StructEnd) of a host object.
		void encode_struct(const field_accessor& obj, const compiled_schema& schema) {
			depth_guard guard(depth_, out_.size());
			for (const auto& field : schema.fields()) {
				if (opts_.exclude_unset && !obj.is_set(field.name)) {
					continue;
				}
				const auto val = obj.get(field.name);
				if (val.is_null()) {
					continue;
				}
				if (opts_.omit_default && is_default(field, val)) {
					continue;
				}
				if (field.infers_type()) {
					encode_generic_field(field.tag, val);
				}
				else {
					encode_typed_field(field.tag, field.declared_type(), val, field.nested.get());
				}
			}
		}

		// Struct body of a record; fields are already in tag order.
		void encode_record(const value::record& rec) {
			depth_guard guard(depth_, out_.size());
			for (const auto& [tag, val] : rec) {
				encode_generic_field(tag, val);
			}
		}

		// Struct body of a map whose keys name tags. Keys that do not are
		// dropped; fields go out in ascending tag order.
		void encode_map_as_struct(const value::map& entries) {
			depth_guard guard(depth_, out_.size());
			std::vector<std::pair<std::uint8_t, const value*>> items;
			items.reserve(entries.size());
			for (const auto& [k, v] : entries) {
				if (auto tag = detail::key_to_tag(k)) {
					items.emplace_back(*tag, &v);
				}
			}
			std::stable_sort(items.begin(), items.end(),
				[](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
			for (const auto& [tag, v] : items) {
				encode_generic_field(tag, *v);
			}
		}

		// The wire type follows the value kind, checked in this order:
		// integer, floating, bytes, text, list, record or map, object.
		void encode_generic_field(std::uint8_t tag, const value& val) {
			switch (val.kind()) {
			case value_kind::integer:
				out_.write_int(tag, val.as_int());
				break;
			case value_kind::floating:
				out_.write_double(tag, val.as_double());
				break;
			case value_kind::bytes:
				out_.write_bytes(tag, val.as_bytes());
				break;
			case value_kind::text:
				out_.write_string(tag, val.as_text());
				break;
			case value_kind::list:
				write_list(tag, val.as_list());
				break;
			case value_kind::record:
				out_.write_struct_begin(tag);
				encode_record(val.as_record());
				out_.write_struct_end();
				break;
			case value_kind::map:
				write_map(tag, val.as_map());
				break;
			case value_kind::object: {
				const auto& obj = require_object(val);
				out_.write_struct_begin(tag);
				encode_struct(*obj.accessor, *obj.schema);
				out_.write_struct_end();
				break;
			}
			case value_kind::null:
				fail("Cannot infer type of a null value");
			}
		}

		void encode_typed_field(std::uint8_t tag, type_code type, const value& val,
			const compiled_schema* nested = nullptr)
		{
			switch (type) {
			case type_code::int1:
			case type_code::int2:
			case type_code::int4:
			case type_code::int8:
				if (!val.is_int()) {
					fail_kind(val, type);
				}
				out_.write_int(tag, val.as_int());
				break;
			case type_code::fp32:
				if (!val.is_int() && !val.is_double()) {
					fail_kind(val, type);
				}
				out_.write_float(tag, static_cast<float>(val.as_number()));
				break;
			case type_code::fp64:
				if (!val.is_int() && !val.is_double()) {
					fail_kind(val, type);
				}
				out_.write_double(tag, val.as_number());
				break;
			case type_code::string1:
			case type_code::string4:
				if (!val.is_text()) {
					fail_kind(val, type);
				}
				out_.write_string(tag, val.as_text());
				break;
			case type_code::map:
				if (val.is_record()) {
					write_record_as_map(tag, val.as_record());
				}
				else if (val.is_map()) {
					write_map(tag, val.as_map());
				}
				else {
					fail_kind(val, type);
				}
				break;
			case type_code::list:
				if (!val.is_list()) {
					fail_kind(val, type);
				}
				write_list(tag, val.as_list());
				break;
			case type_code::simple_list:
				if (val.is_bytes()) {
					out_.write_bytes(tag, val.as_bytes());
				}
				else {
					write_blob(tag, val, nested);
				}
				break;
			case type_code::struct_begin:
				out_.write_struct_begin(tag);
				write_struct_body(val, nested);
				out_.write_struct_end();
				break;
			case type_code::zero_tag:
			case type_code::struct_end:
				fail(std::format("Unsupported declared type {}", type_code_name(type)));
			}
		}

	private:

		void write_list(std::uint8_t tag, const value::list& items) {
			depth_guard guard(depth_, out_.size());
			out_.write_tag(tag, type_code::list);
			out_.write_int(0, static_cast<std::int64_t>(items.size()));
			for (const auto& item : items) {
				encode_generic_field(0, item);
			}
		}

		void write_map(std::uint8_t tag, const value::map& entries) {
			depth_guard guard(depth_, out_.size());
			out_.write_tag(tag, type_code::map);
			out_.write_int(0, static_cast<std::int64_t>(entries.size()));
			for (const auto& [k, v] : entries) {
				encode_generic_field(0, k);
				encode_generic_field(1, v);
			}
		}

		void write_record_as_map(std::uint8_t tag, const value::record& rec) {
			depth_guard guard(depth_, out_.size());
			out_.write_tag(tag, type_code::map);
			out_.write_int(0, static_cast<std::int64_t>(rec.size()));
			for (const auto& [field_tag, v] : rec) {
				out_.write_int(0, field_tag);
				encode_generic_field(1, v);
			}
		}

		// Everything that may stand for a struct body.
		void write_struct_body(const value& val, const compiled_schema* nested) {
			switch (val.kind()) {
			case value_kind::object: {
				const auto& obj = require_object(val);
				encode_struct(*obj.accessor, *obj.schema);
				break;
			}
			case value_kind::record:
				encode_record(val.as_record());
				break;
			case value_kind::map:
				if (nested) {
					encode_struct(field_map(val), *nested);
				}
				else {
					encode_map_as_struct(val.as_map());
				}
				break;
			default:
				fail(std::format("Cannot encode {} value as struct", value_kind_name(val.kind())));
			}
		}

		// Serialized sub-struct carried in a SimpleList, same byte order.
		void write_blob(std::uint8_t tag, const value& val, const compiled_schema* nested) {
			detail::scratch_lease lease(opts_.order);
			encoder inner(lease.get(), opts_);
			inner.depth_ = depth_;
			if (val.is_map() || val.is_record() || val.is_object()) {
				inner.write_struct_body(val, nested);
			}
			else {
				inner.encode_generic_field(0, val);
			}
			out_.write_bytes(tag, lease.get().view());
		}

		// Float fields take integers, so compare those by numeric value.
		static bool is_default(const field_descriptor& field, const value& val) {
			const auto type = field.declared_type();
			if (!field.infers_type() && (type == type_code::fp32 || type == type_code::fp64)) {
				const auto& def = field.default_value;
				if ((val.is_int() || val.is_double()) && (def.is_int() || def.is_double())) {
					return val.as_number() == def.as_number();
				}
			}
			return val == field.default_value;
		}

		static const value::object& require_object(const value& val) {
			const auto& obj = val.as_object();
			if (!obj.accessor || !obj.schema) {
				throw core::codec_error(0, "Object value has no accessor or schema");
			}
			return obj;
		}

		[[noreturn]] void fail_kind(const value& val, type_code type) const {
			fail(std::format("Cannot encode {} value as {}", value_kind_name(val.kind()), type_code_name(type)));
		}

		[[noreturn]] void fail(const std::string& msg) const {
			throw core::codec_error(out_.size(), msg);
		}

		writer& out_;
		codec_options opts_;
		std::size_t depth_ = 0;
	};

} // namespace jce::codec
