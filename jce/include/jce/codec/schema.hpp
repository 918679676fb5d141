/*
 * File: schema.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-14
 * License: MIT
 */

#pragma once

#include <array>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "jce/core/error.hpp"
#include "jce/core/log.hpp"
#include "jce/codec/type_code.hpp"
#include "jce/codec/value.hpp"

namespace jce::codec {

	class compiled_schema;
	using schema_ptr = std::shared_ptr<const compiled_schema>;

	struct field_descriptor {
		std::string name;
		std::uint8_t tag = 0;
		std::uint8_t type = infer_type;
		value default_value;
		std::uint32_t flags = 0;
		// Layout of a StructBegin field; without it the field decodes generically.
		schema_ptr nested;

		bool infers_type() const noexcept { return type == infer_type; }
		type_code declared_type() const noexcept { return static_cast<type_code>(type); }
	};

	// Descriptor list plus a tag -> index table. Immutable after construction.
	class compiled_schema {
	public:

		static constexpr std::int16_t no_field = -1;
		using descriptor_list = std::vector<field_descriptor>;

		explicit compiled_schema(descriptor_list fields)
			: fields_(std::move(fields))
		{
			lookup_.fill(no_field);
			for (std::size_t i = 0; i < fields_.size(); ++i) {
				const auto& f = fields_[i];
				if (f.type != infer_type && !is_valid_type_code(f.type)) {
					throw core::codec_error(0,
						std::format("Field '{}' declares unknown type {}", f.name, f.type));
				}
				if (lookup_[f.tag] != no_field) {
					throw core::duplicate_tag_error(f.tag);
				}
				lookup_[f.tag] = static_cast<std::int16_t>(i);
			}
			core::logger().debug("compiled schema with {} fields", fields_.size());
		}

		static schema_ptr compile(descriptor_list fields) {
			return std::make_shared<compiled_schema>(std::move(fields));
		}

		const descriptor_list& fields() const noexcept { return fields_; }
		std::size_t size() const noexcept { return fields_.size(); }
		bool empty() const noexcept { return fields_.empty(); }

		std::optional<std::size_t> index_of(std::uint8_t tag) const noexcept {
			const auto idx = lookup_[tag];
			if (idx == no_field) {
				return std::nullopt;
			}
			return static_cast<std::size_t>(idx);
		}

		const field_descriptor* find(std::uint8_t tag) const noexcept {
			const auto idx = lookup_[tag];
			return idx == no_field ? nullptr : &fields_[static_cast<std::size_t>(idx)];
		}

		const field_descriptor* find(std::string_view name) const noexcept {
			for (const auto& f : fields_) {
				if (f.name == name) {
					return &f;
				}
			}
			return nullptr;
		}

	private:
		descriptor_list fields_;
		std::array<std::int16_t, 256> lookup_{};
	};

	// How the struct codec reaches into a host object.
	class field_accessor {
	public:
		virtual ~field_accessor() = default;

		// null means the field is absent and will not be written
		virtual value get(std::string_view name) const = 0;

		// Consulted only when encoding with exclude_unset.
		virtual bool is_set(std::string_view /*name*/) const { return true; }

		virtual void set(std::string_view name, value val) = 0;
	};

	// Accessor over a plain name -> value table. Fields stored with init() hold
	// a value but count as never explicitly set.
	class field_map : public field_accessor {
	public:

		field_map() = default;

		// Text keys of a value::map become field names.
		explicit field_map(const value& fields) {
			if (!fields.is_map()) {
				return;
			}
			for (const auto& [k, v] : fields.as_map()) {
				if (k.is_text()) {
					set(k.as_text(), v);
				}
			}
		}

		value get(std::string_view name) const override {
			auto it = values_.find(name);
			return it == values_.end() ? value{} : it->second;
		}

		bool is_set(std::string_view name) const override {
			return explicitly_set_.find(name) != explicitly_set_.end();
		}

		void set(std::string_view name, value val) override {
			values_.insert_or_assign(std::string(name), std::move(val));
			explicitly_set_.emplace(name);
		}

		void init(std::string_view name, value val) {
			values_.insert_or_assign(std::string(name), std::move(val));
		}

		bool contains(std::string_view name) const {
			return values_.find(name) != values_.end();
		}

		std::size_t size() const noexcept { return values_.size(); }

		value to_value() const {
			value::map out;
			out.reserve(values_.size());
			for (const auto& [k, v] : values_) {
				out.emplace_back(value(k), v);
			}
			return value(std::move(out));
		}

	private:
		std::map<std::string, value, std::less<>> values_;
		std::set<std::string, std::less<>> explicitly_set_;
	};

	// Caller-owned memo of compiled schemas keyed by schema identity.
	class schema_cache {
	public:

		using provider_type = std::function<compiled_schema::descriptor_list()>;

		schema_ptr get_or_compile(const std::string& key, const provider_type& provider) {
			std::lock_guard<std::mutex> lock(mutex_);
			if (auto it = cache_.find(key); it != cache_.end()) {
				return it->second;
			}
			auto compiled = compiled_schema::compile(provider());
			cache_.emplace(key, compiled);
			return compiled;
		}

		schema_ptr find(std::string_view key) const {
			std::lock_guard<std::mutex> lock(mutex_);
			auto it = cache_.find(key);
			return it == cache_.end() ? nullptr : it->second;
		}

		void erase(std::string_view key) {
			std::lock_guard<std::mutex> lock(mutex_);
			if (auto it = cache_.find(key); it != cache_.end()) {
				cache_.erase(it);
			}
		}

		void clear() {
			std::lock_guard<std::mutex> lock(mutex_);
			cache_.clear();
		}

		std::size_t size() const {
			std::lock_guard<std::mutex> lock(mutex_);
			return cache_.size();
		}

	private:
		mutable std::mutex mutex_;
		std::map<std::string, schema_ptr, std::less<>> cache_;
	};

} // namespace jce::codec
