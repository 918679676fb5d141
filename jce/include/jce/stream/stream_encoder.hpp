/*
 * File: stream_encoder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-17
 * License: MIT
 */

#pragma once

#include <utility>

#include "jce/core/bytes.hpp"
#include "jce/core/log.hpp"
#include "jce/codec/options.hpp"
#include "jce/codec/value.hpp"
#include "jce/codec/schema.hpp"
#include "jce/codec/codec.hpp"
#include "jce/stream/frame_settings.hpp"
#include "jce/stream/framer.hpp"

namespace jce::stream {

	// Encodes values and appends them as length-prefixed frames.
	class stream_encoder {
	public:

		explicit stream_encoder(frame_settings settings = {}, int flags = codec::option_flags::none)
			: framer_(settings)
			, flags_(flags)
		{}

		const frame_settings& settings() const noexcept { return framer_.settings(); }

		stream_encoder& write(const codec::value& val) {
			return write_frame(codec::encode_generic(val, flags_));
		}

		stream_encoder& write(const codec::field_accessor& obj, const codec::compiled_schema& schema) {
			return write_frame(codec::encode_struct(obj, schema, flags_));
		}

		stream_encoder& write(const codec::value& fields, const codec::compiled_schema& schema) {
			return write_frame(codec::encode_struct(fields, schema, flags_));
		}

		// The buffer is left untouched when the body cannot be framed.
		stream_encoder& write_frame(byte_view body) {
			framer_.append_header(buffer_, body.size());
			buffer_.insert(buffer_.end(), body.begin(), body.end());
			core::logger().debug("frame written: {} bytes", body.size() + framer_.header_size());
			return *this;
		}

		byte_view buffer() const noexcept { return buffer_; }
		std::size_t size() const noexcept { return buffer_.size(); }

		byte_buffer take() noexcept {
			return std::exchange(buffer_, byte_buffer{});
		}

		void clear() noexcept { buffer_.clear(); }

	private:
		framer framer_;
		int flags_ = codec::option_flags::none;
		byte_buffer buffer_;
	};

} // namespace jce::stream
