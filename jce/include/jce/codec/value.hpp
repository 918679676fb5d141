/*
 * File: value.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-14
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <variant>
#include <utility>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <limits>
#include <type_traits>
#include <stdexcept>

#include "jce/core/bytes.hpp"

namespace jce::codec {

	using core::byte;
	using core::byte_buffer;
	using core::byte_view;

	class field_accessor;
	class compiled_schema;

	enum class value_kind : std::uint8_t {
		null,
		integer,
		floating,
		text,
		bytes,
		list,
		map,
		record,
		object,
	};

	constexpr inline const char* value_kind_name(value_kind kind) noexcept {
		switch (kind) {
		case value_kind::null:     return "null";
		case value_kind::integer:  return "integer";
		case value_kind::floating: return "floating";
		case value_kind::text:     return "text";
		case value_kind::bytes:    return "bytes";
		case value_kind::list:     return "list";
		case value_kind::map:      return "map";
		case value_kind::record:   return "record";
		case value_kind::object:   return "object";
		}
		return "unknown";
	}

	// Schema-less value model exchanged with the generic codec.
	class value {
	public:

		using list = std::vector<value>;
		using map = std::vector<std::pair<value, value>>;

		// A struct: fields ordered by tag, each tag at most once.
		class record {
		public:
			using field = std::pair<std::uint8_t, value>;
			using container = std::vector<field>;
			using const_iterator = container::const_iterator;

			record() = default;
			record(std::initializer_list<field> init) {
				for (const auto& f : init) {
					set(f.first, f.second);
				}
			}

			value& set(std::uint8_t tag, value val) {
				auto it = lower_bound(tag);
				if (it != fields_.end() && it->first == tag) {
					it->second = std::move(val);
					return it->second;
				}
				return fields_.emplace(it, tag, std::move(val))->second;
			}

			const value* find(std::uint8_t tag) const {
				auto it = std::lower_bound(fields_.begin(), fields_.end(), tag,
					[](const field& f, std::uint8_t t) { return f.first < t; });
				return (it != fields_.end() && it->first == tag) ? &it->second : nullptr;
			}

			bool contains(std::uint8_t tag) const { return find(tag) != nullptr; }

			bool erase(std::uint8_t tag) {
				auto it = lower_bound(tag);
				if (it != fields_.end() && it->first == tag) {
					fields_.erase(it);
					return true;
				}
				return false;
			}

			const value& at(std::uint8_t tag) const {
				if (auto v = find(tag)) {
					return *v;
				}
				throw std::out_of_range("record has no field with tag " + std::to_string(tag));
			}

			std::size_t size() const noexcept { return fields_.size(); }
			bool empty() const noexcept { return fields_.empty(); }
			const_iterator begin() const noexcept { return fields_.begin(); }
			const_iterator end() const noexcept { return fields_.end(); }

			friend bool operator == (const record& lhs, const record& rhs) {
				return lhs.fields_ == rhs.fields_;
			}

		private:
			container::iterator lower_bound(std::uint8_t tag) {
				return std::lower_bound(fields_.begin(), fields_.end(), tag,
					[](const field& f, std::uint8_t t) { return f.first < t; });
			}

			container fields_;
		};

		// Host object paired with the schema that describes it. Encode only.
		struct object {
			std::shared_ptr<const field_accessor> accessor;
			std::shared_ptr<const compiled_schema> schema;

			friend bool operator == (const object& lhs, const object& rhs) {
				return lhs.accessor == rhs.accessor && lhs.schema == rhs.schema;
			}
		};

		value() = default;
		value(std::nullptr_t) {}

		template <typename IntT>
			requires std::is_integral_v<IntT> && (std::is_signed_v<IntT> || sizeof(IntT) < sizeof(std::int64_t))
		value(IntT v) : data_(static_cast<std::int64_t>(v)) {}

		// 64-bit unsigned input must fit the signed wire range.
		template <typename UintT>
			requires std::is_integral_v<UintT> && std::is_unsigned_v<UintT> && (sizeof(UintT) >= sizeof(std::int64_t))
		value(UintT v) : data_(checked_int(v)) {}

		value(double v) : data_(v) {}
		value(float v) : data_(static_cast<double>(v)) {}
		value(std::string v) : data_(std::move(v)) {}
		value(std::string_view v) : data_(std::string(v)) {}
		value(const char* v) : data_(std::string(v)) {}
		value(byte_buffer v) : data_(std::move(v)) {}
		value(list v) : data_(std::move(v)) {}
		value(map v) : data_(std::move(v)) {}
		value(record v) : data_(std::move(v)) {}
		value(object v) : data_(std::move(v)) {}

		static value from_bytes(byte_view v) {
			return value(byte_buffer(v.begin(), v.end()));
		}

		value_kind kind() const noexcept {
			return static_cast<value_kind>(data_.index());
		}

		bool is_null() const noexcept { return kind() == value_kind::null; }
		bool is_int() const noexcept { return kind() == value_kind::integer; }
		bool is_double() const noexcept { return kind() == value_kind::floating; }
		bool is_text() const noexcept { return kind() == value_kind::text; }
		bool is_bytes() const noexcept { return kind() == value_kind::bytes; }
		bool is_list() const noexcept { return kind() == value_kind::list; }
		bool is_map() const noexcept { return kind() == value_kind::map; }
		bool is_record() const noexcept { return kind() == value_kind::record; }
		bool is_object() const noexcept { return kind() == value_kind::object; }

		std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
		double as_double() const { return std::get<double>(data_); }
		const std::string& as_text() const { return std::get<std::string>(data_); }
		const byte_buffer& as_bytes() const { return std::get<byte_buffer>(data_); }
		const list& as_list() const { return std::get<list>(data_); }
		const map& as_map() const { return std::get<map>(data_); }
		const record& as_record() const { return std::get<record>(data_); }
		const object& as_object() const { return std::get<object>(data_); }

		list& as_list() { return std::get<list>(data_); }
		map& as_map() { return std::get<map>(data_); }
		record& as_record() { return std::get<record>(data_); }

		// Integers widen to double; used where a floating field accepts either.
		double as_number() const {
			return is_int() ? static_cast<double>(as_int()) : as_double();
		}

		const value* find_key(const value& key) const {
			if (!is_map()) {
				return nullptr;
			}
			for (const auto& [k, v] : as_map()) {
				if (k == key) {
					return &v;
				}
			}
			return nullptr;
		}

		friend bool operator == (const value& lhs, const value& rhs) {
			if (lhs.kind() != rhs.kind()) {
				return false;
			}
			if (lhs.is_map()) {
				return maps_equal(lhs.as_map(), rhs.as_map());
			}
			return lhs.data_ == rhs.data_;
		}

		friend std::ostream& operator << (std::ostream& os, const value& v) {
			v.print(os);
			return os;
		}

	private:

		template <typename UintT>
		static std::int64_t checked_int(UintT v) {
			if (v > static_cast<UintT>(std::numeric_limits<std::int64_t>::max())) {
				throw std::out_of_range("integer " + std::to_string(v) + " does not fit a signed 64-bit value");
			}
			return static_cast<std::int64_t>(v);
		}

		// Maps compare as sets of entries.
		static bool maps_equal(const map& lhs, const map& rhs) {
			if (lhs.size() != rhs.size()) {
				return false;
			}
			std::vector<bool> used(rhs.size(), false);
			for (const auto& entry : lhs) {
				bool matched = false;
				for (std::size_t i = 0; i < rhs.size(); ++i) {
					if (!used[i] && rhs[i].first == entry.first && rhs[i].second == entry.second) {
						used[i] = true;
						matched = true;
						break;
					}
				}
				if (!matched) {
					return false;
				}
			}
			return true;
		}

		void print(std::ostream& os) const {
			switch (kind()) {
			case value_kind::null:
				os << "null";
				break;
			case value_kind::integer:
				os << as_int();
				break;
			case value_kind::floating:
				os << as_double();
				break;
			case value_kind::text:
				os << std::quoted(as_text());
				break;
			case value_kind::bytes: {
				os << "b\"";
				const auto flags = os.flags();
				for (auto b : as_bytes()) {
					os << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(b);
				}
				os.flags(flags);
				os << "\"";
				break;
			}
			case value_kind::list: {
				os << "[";
				bool first = true;
				for (const auto& item : as_list()) {
					os << (first ? "" : ", ") << item;
					first = false;
				}
				os << "]";
				break;
			}
			case value_kind::map: {
				os << "{";
				bool first = true;
				for (const auto& [k, v] : as_map()) {
					os << (first ? "" : ", ") << k << ": " << v;
					first = false;
				}
				os << "}";
				break;
			}
			case value_kind::record: {
				os << "struct{";
				bool first = true;
				for (const auto& [tag, v] : as_record()) {
					os << (first ? "" : ", ") << static_cast<unsigned>(tag) << ": " << v;
					first = false;
				}
				os << "}";
				break;
			}
			case value_kind::object:
				os << "<object>";
				break;
			}
		}

		std::variant<
			std::monostate,
			std::int64_t,
			double,
			std::string,
			byte_buffer,
			list,
			map,
			record,
			object
		> data_;
	};

} // namespace jce::codec
