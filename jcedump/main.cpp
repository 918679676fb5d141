#include "jce/core/bytes.hpp"
#include "jce/core/error.hpp"
#include "jce/core/log.hpp"
#include "jce/codec/codec.hpp"
#include "jce/codec/dump.hpp"

#include <CLI/CLI.hpp>

#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <string>

namespace {
	using namespace jce;

	std::optional<core::byte_buffer> parse_hex(const std::string& text) {
		std::string digits;
		digits.reserve(text.size());
		for (char c : text) {
			if (std::isspace(static_cast<unsigned char>(c))) {
				continue;
			}
			if (!std::isxdigit(static_cast<unsigned char>(c))) {
				return std::nullopt;
			}
			digits.push_back(c);
		}
		if (digits.size() % 2 != 0) {
			return std::nullopt;
		}
		core::byte_buffer out;
		out.reserve(digits.size() / 2);
		for (std::size_t i = 0; i < digits.size(); i += 2) {
			out.push_back(static_cast<core::byte>(std::stoul(digits.substr(i, 2), nullptr, 16)));
		}
		return out;
	}

	std::optional<core::byte_buffer> read_file(const std::string& path) {
		std::ifstream in(path, std::ios::binary);
		if (!in) {
			return std::nullopt;
		}
		std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
		return core::to_buffer(raw);
	}

	int cmd_tree(core::byte_view data, codec::endian_mode order) {
		try {
			std::cout << codec::dump(data, order);
			return 0;
		}
		catch (const core::codec_error& e) {
			std::cerr << "Error decoding payload: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_generic(core::byte_view data, int flags, codec::bytes_mode mode) {
		try {
			std::cout << codec::decode_generic(data, flags, mode) << "\n";
			return 0;
		}
		catch (const core::codec_error& e) {
			std::cerr << "Error decoding payload: " << e.what() << "\n";
			return 1;
		}
	}
}

int main(int argc, char* argv[]) {
	CLI::App app{ "jcedump - JCE/Tars payload inspector" };

	std::string hex;
	std::string file;
	std::string mode = "tree";
	bool little_endian = false;
	bool verbose = false;
	codec::bytes_mode bytes = codec::bytes_mode::automatic;

	const std::map<std::string, codec::bytes_mode> bytes_modes{
		{ "raw", codec::bytes_mode::raw },
		{ "string", codec::bytes_mode::string },
		{ "auto", codec::bytes_mode::automatic },
	};

	auto hex_opt = app.add_option("hex", hex, "Payload as hex digits (whitespace is ignored)");
	auto file_opt = app.add_option("-f,--file", file, "Read the raw payload from a file")
		->check(CLI::ExistingFile);
	hex_opt->excludes(file_opt);

	app.add_option("-m,--mode", mode, "Output: node tree or generic value")
		->check(CLI::IsMember({ "tree", "generic" }))
		->capture_default_str();
	app.add_flag("-l,--little-endian", little_endian, "Payload uses little-endian byte order");
	app.add_option("-b,--bytes-mode", bytes, "SimpleList handling in generic mode: raw, string, auto")
		->transform(CLI::CheckedTransformer(bytes_modes, CLI::ignore_case))
		->default_str("auto");
	app.add_flag("-v,--verbose", verbose, "Enable debug logging");

	CLI11_PARSE(app, argc, argv);

	if (verbose) {
		core::logger().set_level(spdlog::level::debug);
	}

	std::optional<core::byte_buffer> payload;
	if (!file.empty()) {
		payload = read_file(file);
		if (!payload) {
			std::cerr << "Cannot read file: " << file << "\n";
			return 1;
		}
	}
	else if (!hex.empty()) {
		payload = parse_hex(hex);
		if (!payload) {
			std::cerr << "Invalid hex string\n";
			return 1;
		}
	}
	else {
		std::cerr << "Nothing to decode: pass a hex string or --file\n";
		return 1;
	}

	const auto order = little_endian ? codec::endian_mode::little : codec::endian_mode::big;
	if (mode == "generic") {
		const int flags = little_endian ? codec::option_flags::little_endian : codec::option_flags::none;
		return cmd_generic(*payload, flags, bytes);
	}
	return cmd_tree(*payload, order);
}
