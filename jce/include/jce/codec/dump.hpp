/*
 * File: dump.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-16
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "jce/core/bytes.hpp"
#include "jce/codec/type_code.hpp"
#include "jce/codec/options.hpp"
#include "jce/codec/depth_guard.hpp"
#include "jce/codec/reader.hpp"
#include "jce/codec/scanner.hpp"
#include "jce/codec/utf8.hpp"
#include "jce/codec/value.hpp"

namespace jce::codec {

	// One wire field as it was found, without a schema.
	struct node {
		std::uint8_t tag = 0;
		type_code type = type_code::zero_tag;
		std::size_t offset = 0;   // header position
		std::size_t length = 0;   // header and body
		value leaf;               // scalars and opaque SimpleList payloads
		std::vector<node> children;

		bool has_children() const noexcept { return !children.empty(); }
	};

	class node_parser {
	public:

		explicit node_parser(byte_view data, endian_mode order = endian_mode::big)
			: in_(data, order)
		{}

		// Every field until the end of input.
		std::vector<node> parse() {
			std::vector<node> out;
			while (!in_.is_end()) {
				out.push_back(parse_node());
			}
			return out;
		}

	private:

		node parse_node() {
			node n;
			n.offset = in_.position();
			const auto head = in_.read_head();
			n.tag = head.tag;
			n.type = head.type;
			parse_body(n);
			n.length = in_.position() - n.offset;
			return n;
		}

		void parse_body(node& n) {
			switch (n.type) {
			case type_code::int1:
			case type_code::int2:
			case type_code::int4:
			case type_code::int8:
			case type_code::zero_tag:
				n.leaf = in_.read_int(n.type);
				break;
			case type_code::fp32:
				n.leaf = static_cast<double>(in_.read_float());
				break;
			case type_code::fp64:
				n.leaf = in_.read_double();
				break;
			case type_code::string1:
			case type_code::string4:
				n.leaf = std::string(in_.read_string(n.type));
				break;
			case type_code::map: {
				depth_guard guard(depth_, n.offset);
				const auto size = in_.read_size();
				for (std::size_t i = 0; i < size * 2; ++i) {
					n.children.push_back(parse_node());
				}
				break;
			}
			case type_code::list: {
				depth_guard guard(depth_, n.offset);
				const auto size = in_.read_size();
				for (std::size_t i = 0; i < size; ++i) {
					n.children.push_back(parse_node());
				}
				break;
			}
			case type_code::simple_list:
				parse_blob(n);
				break;
			case type_code::struct_begin: {
				depth_guard guard(depth_, n.offset);
				while (true) {
					auto child = parse_node();
					if (child.type == type_code::struct_end) {
						break;
					}
					n.children.push_back(std::move(child));
				}
				break;
			}
			case type_code::struct_end:
				break;
			}
		}

		// Payloads that scan as a struct are expanded in place.
		void parse_blob(node& n) {
			in_.read_simple_list_marker();
			const auto bytes = in_.read_bytes(in_.read_size());
			if (!bytes.empty() && !utf8::is_safe_text(bytes)) {
				scanner probe(bytes, in_.order());
				if (probe.validate_all()) {
					depth_guard guard(depth_, n.offset);
					node_parser nested(bytes, in_.order());
					nested.depth_ = depth_;
					n.children = nested.parse();
					return;
				}
			}
			n.leaf = value::from_bytes(bytes);
		}

		reader in_;
		std::size_t depth_ = 0;
	};

	inline void print_node(std::ostream& os, const node& n, int indent = 0) {
		const auto pad = std::string(indent, ' ');
		os << pad << "[" << static_cast<unsigned>(n.tag) << "] " << type_code_name(n.type);
		switch (n.type) {
		case type_code::map:
			os << std::format("({}):\n", n.children.size() / 2);
			break;
		case type_code::list:
			os << std::format("({}):\n", n.children.size());
			break;
		case type_code::struct_begin:
			os << ":\n";
			break;
		case type_code::simple_list:
			if (n.has_children()) {
				os << " struct:\n";
			}
			else {
				const auto& bytes = n.leaf.as_bytes();
				os << std::format("({}): ", bytes.size());
				if (utf8::is_safe_text(bytes)) {
					os << "\"" << core::as_chars(bytes) << "\"";
				}
				else {
					for (auto b : bytes) {
						os << std::format("{:02x}", core::to_u8(b));
					}
				}
				os << "\n";
			}
			break;
		default:
			os << ": " << n.leaf << "\n";
			break;
		}
		for (const auto& child : n.children) {
			print_node(os, child, indent + 2);
		}
	}

	inline std::ostream& print_nodes(std::ostream& os, const std::vector<node>& nodes) {
		for (const auto& n : nodes) {
			print_node(os, n);
		}
		return os;
	}

	inline std::string dump(byte_view data, endian_mode order = endian_mode::big) {
		std::ostringstream os;
		print_nodes(os, node_parser(data, order).parse());
		return os.str();
	}

} // namespace jce::codec
