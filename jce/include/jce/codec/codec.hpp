/*
 * File: codec.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-16
 * License: MIT
 */

#pragma once

#include <format>

#include "jce/core/bytes.hpp"
#include "jce/core/error.hpp"
#include "jce/codec/options.hpp"
#include "jce/codec/writer.hpp"
#include "jce/codec/reader.hpp"
#include "jce/codec/value.hpp"
#include "jce/codec/schema.hpp"
#include "jce/codec/encoder.hpp"
#include "jce/codec/decoder.hpp"

namespace jce::codec {

	// Options arguments below are option_flags bits.

	inline byte_buffer encode_struct(const field_accessor& obj, const compiled_schema& schema, int flags = option_flags::none) {
		const auto opts = codec_options::from_flags(flags);
		detail::scratch_lease lease(opts.order);
		encoder(lease.get(), opts).encode_struct(obj, schema);
		return core::to_buffer(lease.get().view());
	}

	// fields is a name -> value map or an object value.
	inline byte_buffer encode_struct(const value& fields, const compiled_schema& schema, int flags = option_flags::none) {
		if (fields.is_object()) {
			const auto& obj = fields.as_object();
			if (!obj.accessor) {
				throw core::codec_error(0, "Object value has no accessor");
			}
			return encode_struct(*obj.accessor, schema, flags);
		}
		if (!fields.is_map()) {
			throw core::codec_error(0, std::format("Cannot encode {} value as struct", value_kind_name(fields.kind())));
		}
		return encode_struct(field_map(fields), schema, flags);
	}

	// Records, maps and objects become a struct body; anything else is a
	// single field under tag 0.
	inline byte_buffer encode_generic(const value& val, int flags = option_flags::none) {
		const auto opts = codec_options::from_flags(flags);
		detail::scratch_lease lease(opts.order);
		encoder enc(lease.get(), opts);
		switch (val.kind()) {
		case value_kind::record:
			enc.encode_record(val.as_record());
			break;
		case value_kind::map:
			enc.encode_map_as_struct(val.as_map());
			break;
		case value_kind::object: {
			const auto& obj = val.as_object();
			if (!obj.accessor || !obj.schema) {
				throw core::codec_error(0, "Object value has no accessor or schema");
			}
			enc.encode_struct(*obj.accessor, *obj.schema);
			break;
		}
		default:
			enc.encode_generic_field(0, val);
			break;
		}
		return core::to_buffer(lease.get().view());
	}

	inline value decode_struct(byte_view data, const compiled_schema& schema, int flags = option_flags::none) {
		reader in(data, codec_options::from_flags(flags).order);
		return decoder(in).decode_struct(schema);
	}

	inline void decode_struct(byte_view data, const compiled_schema& schema, field_accessor& target, int flags = option_flags::none) {
		reader in(data, codec_options::from_flags(flags).order);
		decoder(in).decode_struct_into(schema, target);
	}

	// Always a record: the buffer is read as one struct body.
	inline value decode_generic(byte_view data, int flags = option_flags::none, bytes_mode mode = bytes_mode::automatic) {
		reader in(data, codec_options::from_flags(flags).order);
		return value(decoder(in, mode).decode_record());
	}

} // namespace jce::codec
