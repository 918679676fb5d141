/*
 * File: stream_decoder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-17
 * License: MIT
 */

#pragma once

#include <optional>
#include <utility>

#include "jce/core/bytes.hpp"
#include "jce/core/error.hpp"
#include "jce/core/log.hpp"
#include "jce/codec/options.hpp"
#include "jce/codec/value.hpp"
#include "jce/codec/schema.hpp"
#include "jce/codec/codec.hpp"
#include "jce/stream/frame_settings.hpp"
#include "jce/stream/framer.hpp"

namespace jce::stream {

	// Reassembles length-prefixed packets from arbitrarily split input and
	// decodes each body, by schema when one is given, generically otherwise.
	// One instance per stream; not for concurrent use.
	class stream_decoder {
	public:

		explicit stream_decoder(frame_settings settings = {}, int flags = codec::option_flags::none,
			codec::bytes_mode mode = codec::bytes_mode::automatic)
			: framer_(settings)
			, flags_(flags)
			, mode_(mode)
		{}

		stream_decoder(codec::schema_ptr schema, frame_settings settings = {}, int flags = codec::option_flags::none)
			: framer_(settings)
			, flags_(flags)
			, schema_(std::move(schema))
		{}

		const frame_settings& settings() const noexcept { return framer_.settings(); }

		// All-or-nothing: input that would overflow max_buffer_size is rejected
		// and nothing is appended.
		void feed(byte_view data) {
			const auto limit = settings().max_buffer_size;
			const auto wanted = buffer_.size() + data.size();
			if (wanted > limit) {
				throw core::frame_error::buffer_limit(wanted, limit);
			}
			buffer_.insert(buffer_.end(), data.begin(), data.end());
		}

		// The next decoded packet, or nullopt until one is complete.
		std::optional<codec::value> next() {
			const auto packet_size = framer_.check_frame(buffer_);
			if (!packet_size) {
				return std::nullopt;
			}
			const auto header_len = framer_.header_size();
			const auto body = byte_view(buffer_).subspan(header_len, *packet_size - header_len);
			core::logger().debug("frame ready: {} bytes", *packet_size);
			try {
				auto result = decode_body(body);
				consume(*packet_size);
				return result;
			}
			catch (const core::codec_error& e) {
				if (settings().on_decode_error == decode_failure_policy::discard) {
					consume(*packet_size);
					core::logger().warn("dropped undecodable frame of {} bytes: {}", *packet_size, e.what());
				}
				else {
					core::logger().warn("kept undecodable frame of {} bytes: {}", *packet_size, e.what());
				}
				throw;
			}
		}

		byte_view buffer() const noexcept { return buffer_; }
		std::size_t buffered() const noexcept { return buffer_.size(); }
		void clear() noexcept { buffer_.clear(); }

	private:

		codec::value decode_body(byte_view body) const {
			if (schema_) {
				return codec::decode_struct(body, *schema_, flags_);
			}
			return codec::decode_generic(body, flags_, mode_);
		}

		void consume(std::size_t size) {
			buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(size));
		}

		framer framer_;
		int flags_ = codec::option_flags::none;
		codec::bytes_mode mode_ = codec::bytes_mode::automatic;
		codec::schema_ptr schema_;
		byte_buffer buffer_;
	};

} // namespace jce::stream
