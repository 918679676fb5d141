/*
 * File: log.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-13
 * License: MIT
 */

#pragma once

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace jce::core {

	namespace detail {
		inline std::shared_ptr<spdlog::logger> make_default_logger() {
			if (auto existing = spdlog::get("jce")) {
				return existing;
			}
			auto created = spdlog::stderr_color_mt("jce");
			created->set_level(spdlog::level::warn);
			return created;
		}

		inline std::shared_ptr<spdlog::logger>& logger_slot() {
			static std::shared_ptr<spdlog::logger> instance = make_default_logger();
			return instance;
		}
	}

	// Library-wide logger. Replace it before the first encode/decode call if
	// the application owns its own sinks.
	inline spdlog::logger& logger() {
		return *detail::logger_slot();
	}

	inline void set_logger(std::shared_ptr<spdlog::logger> replacement) {
		if (replacement) {
			detail::logger_slot() = std::move(replacement);
		}
	}

} // namespace jce::core
