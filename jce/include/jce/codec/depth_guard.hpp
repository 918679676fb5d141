/*
 * File: depth_guard.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-14
 * License: MIT
 */

#pragma once

#include <cstddef>

#include "jce/core/error.hpp"
#include "jce/codec/options.hpp"

namespace jce::codec {

	// Counts one level of recursion for its lifetime.
	class depth_guard {
	public:
		depth_guard(std::size_t& depth, std::size_t offset)
			: depth_(depth)
		{
			if (depth_ > max_depth) {
				throw core::depth_exceeded_error(offset);
			}
			++depth_;
		}

		~depth_guard() { --depth_; }

		depth_guard(const depth_guard&) = delete;
		depth_guard& operator = (const depth_guard&) = delete;

	private:
		std::size_t& depth_;
	};

} // namespace jce::codec
