/*
 * File: type_code.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-12
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <optional>

namespace jce::codec {

	// Low nibble of a field header.
	enum class type_code : std::uint8_t {
		int1 = 0,
		int2 = 1,
		int4 = 2,
		int8 = 3,
		fp32 = 4,
		fp64 = 5,
		string1 = 6,
		string4 = 7,
		map = 8,
		list = 9,
		struct_begin = 10,
		struct_end = 11,
		zero_tag = 12,
		simple_list = 13,
	};

	// Declared type meaning "decide from the value at runtime".
	constexpr std::uint8_t infer_type = 255;

	constexpr std::uint8_t max_type_code = static_cast<std::uint8_t>(type_code::simple_list);

	constexpr inline bool is_valid_type_code(std::uint8_t raw) noexcept {
		return raw <= max_type_code;
	}

	constexpr inline std::optional<type_code> to_type_code(std::uint8_t raw) noexcept {
		if (!is_valid_type_code(raw)) {
			return std::nullopt;
		}
		return static_cast<type_code>(raw);
	}

	constexpr inline std::uint8_t to_u8(type_code t) noexcept {
		return static_cast<std::uint8_t>(t);
	}

	constexpr inline bool is_integer_type(type_code t) noexcept {
		return t == type_code::int1 || t == type_code::int2
			|| t == type_code::int4 || t == type_code::int8;
	}

	constexpr inline bool is_string_type(type_code t) noexcept {
		return t == type_code::string1 || t == type_code::string4;
	}

	// Whether a wire type can be read as the declared one without falling back
	// to the generic decoder.
	constexpr inline bool is_compatible(type_code declared, type_code wire) noexcept {
		if (is_integer_type(declared)) {
			return is_integer_type(wire) || wire == type_code::zero_tag;
		}
		if (declared == type_code::fp32) {
			return wire == type_code::fp32;
		}
		if (declared == type_code::fp64) {
			return wire == type_code::fp64 || wire == type_code::fp32;
		}
		if (is_string_type(declared)) {
			return is_string_type(wire);
		}
		return declared == wire;
	}

	constexpr inline const char* type_code_name(type_code t) noexcept {
		switch (t) {
		case type_code::int1:         return "Byte";
		case type_code::int2:         return "Short";
		case type_code::int4:         return "Int";
		case type_code::int8:         return "Long";
		case type_code::fp32:         return "Float";
		case type_code::fp64:         return "Double";
		case type_code::string1:
		case type_code::string4:      return "Str";
		case type_code::map:          return "Map";
		case type_code::list:         return "List";
		case type_code::struct_begin: return "Struct";
		case type_code::struct_end:   return "StructEnd";
		case type_code::zero_tag:     return "Zero";
		case type_code::simple_list:  return "SimpleList";
		}
		return "Unknown";
	}

} // namespace jce::codec
