/*
 * File: error.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-12
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <format>

namespace jce::core {

	enum class error_code : std::uint8_t {
		buffer_overflow,
		invalid_type,
		custom,
		depth_exceeded,
		duplicate_tag,
		frame_invalid_length,
		frame_too_large,
		buffer_limit,
	};

	constexpr inline const char* error_code_name(error_code code) noexcept {
		switch (code) {
		case error_code::buffer_overflow:      return "BufferOverflow";
		case error_code::invalid_type:         return "InvalidType";
		case error_code::custom:               return "Custom";
		case error_code::depth_exceeded:       return "DepthExceeded";
		case error_code::duplicate_tag:        return "DuplicateTag";
		case error_code::frame_invalid_length: return "FrameInvalidLength";
		case error_code::frame_too_large:      return "FrameTooLarge";
		case error_code::buffer_limit:         return "BufferLimit";
		}
		return "Unknown";
	}

	// Base of every error the codec raises. offset() is the byte position in
	// the input where the failure was detected (0 where it does not apply).
	class codec_error : public std::runtime_error {
	public:
		codec_error(error_code code, std::size_t offset, const std::string& what)
			: std::runtime_error(what)
			, code_(code)
			, offset_(offset)
		{}

		// Contextual decode/encode failure: "Error at offset N: msg"
		codec_error(std::size_t offset, const std::string& msg)
			: codec_error(error_code::custom, offset, std::format("Error at offset {}: {}", offset, msg))
		{}

		error_code errc() const noexcept { return code_; }
		std::size_t offset() const noexcept { return offset_; }

	private:
		error_code code_;
		std::size_t offset_;
	};

	class buffer_overflow_error : public codec_error {
	public:
		explicit buffer_overflow_error(std::size_t offset)
			: codec_error(error_code::buffer_overflow, offset,
				std::format("Unexpected end of buffer at offset {}", offset))
		{}
	};

	class invalid_type_error : public codec_error {
	public:
		invalid_type_error(std::size_t offset, std::uint8_t type_id)
			: codec_error(error_code::invalid_type, offset,
				std::format("Invalid type {} at offset {}", type_id, offset))
			, type_id_(type_id)
		{}

		std::uint8_t type_id() const noexcept { return type_id_; }

	private:
		std::uint8_t type_id_;
	};

	class depth_exceeded_error : public codec_error {
	public:
		explicit depth_exceeded_error(std::size_t offset = 0)
			: codec_error(error_code::depth_exceeded, offset, "Depth exceeded")
		{}
	};

	class duplicate_tag_error : public codec_error {
	public:
		explicit duplicate_tag_error(std::uint8_t tag)
			: codec_error(error_code::duplicate_tag, 0, std::format("Duplicate tag {} in schema", tag))
			, tag_(tag)
		{}

		std::uint8_t tag() const noexcept { return tag_; }

	private:
		std::uint8_t tag_;
	};

	class frame_error : public codec_error {
	public:
		frame_error(error_code code, std::size_t length, std::size_t limit, const std::string& what)
			: codec_error(code, 0, what)
			, length_(length)
			, limit_(limit)
		{}

		static frame_error invalid_length(std::size_t length, std::size_t header_len) {
			return frame_error(error_code::frame_invalid_length, length, header_len,
				std::format("Frame length {} is invalid (less than header length {})", length, header_len));
		}

		static frame_error too_large(std::size_t length, std::size_t limit) {
			return frame_error(error_code::frame_too_large, length, limit,
				std::format("Frame length {} exceeds limit {}", length, limit));
		}

		static frame_error buffer_limit(std::size_t length, std::size_t limit) {
			return frame_error(error_code::buffer_limit, length, limit,
				std::format("Stream buffer size {} would exceed limit {}", length, limit));
		}

		std::size_t length() const noexcept { return length_; }
		std::size_t limit() const noexcept { return limit_; }

	private:
		std::size_t length_;
		std::size_t limit_;
	};

} // namespace jce::core
