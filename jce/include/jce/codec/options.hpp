/*
 * File: options.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-13
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstddef>

#include "jce/core/byteorder.hpp"

namespace jce::codec {

	using core::byteorder::endian_mode;

	// Caller-supplied bit flags of the boundary API.
	namespace option_flags {
		constexpr int none = 0;
		constexpr int little_endian = 1;
		constexpr int omit_default = 32;
		constexpr int exclude_unset = 64;
	}

	// Recursion cap shared by every encoder, decoder, skipper and scanner.
	constexpr std::size_t max_depth = 100;

	struct codec_options {
		endian_mode order = endian_mode::big;
		bool omit_default = false;
		bool exclude_unset = false;

		static constexpr codec_options from_flags(int flags) noexcept {
			codec_options opts;
			opts.order = (flags & option_flags::little_endian) ? endian_mode::little : endian_mode::big;
			opts.omit_default = (flags & option_flags::omit_default) != 0;
			opts.exclude_unset = (flags & option_flags::exclude_unset) != 0;
			return opts;
		}

		constexpr int to_flags() const noexcept {
			return (order == endian_mode::little ? option_flags::little_endian : 0)
				| (omit_default ? option_flags::omit_default : 0)
				| (exclude_unset ? option_flags::exclude_unset : 0);
		}
	};
	static_assert(codec_options::from_flags(option_flags::none).order == endian_mode::big, "big endian is the default");
	static_assert(codec_options::from_flags(97).to_flags() == 97, "flags must round trip");

	// How an opaque SimpleList payload is presented by the generic decoder.
	enum class bytes_mode : std::uint8_t {
		raw = 0,
		string = 1,
		automatic = 2,
	};

	constexpr inline bytes_mode bytes_mode_from_int(int v) noexcept {
		switch (v) {
		case 1: return bytes_mode::string;
		case 2: return bytes_mode::automatic;
		default: return bytes_mode::raw;
		}
	}

} // namespace jce::codec
