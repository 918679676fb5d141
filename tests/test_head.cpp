// tests/test_head.cpp
#include "tests.hpp"

#include <string>

#include "jce/core/error.hpp"
#include "jce/codec/head.hpp"

using namespace jce::core;
using namespace jce::codec;
using jce::tests::bytes;

TEST_SUITE("codec/head") {

    TEST_CASE("short and extended headers") {
        byte_buffer out;

        SUBCASE("tags below 15 use one byte") {
            append_head(out, 0, type_code::int1);
            append_head(out, 14, type_code::simple_list);
            CHECK(out == bytes({ 0x00, 0xED }));
            CHECK(head_size(14) == 1);
        }
        SUBCASE("tags from 15 carry a second byte") {
            append_head(out, 15, type_code::int1);
            append_head(out, 255, type_code::string1);
            CHECK(out == bytes({ 0xF0, 0x0F, 0xF6, 0xFF }));
            CHECK(head_size(15) == 2);
        }
    }

    TEST_CASE("every tag survives a parse") {
        for (unsigned tag = 0; tag < 256; ++tag) {
            byte_buffer out;
            append_head(out, static_cast<std::uint8_t>(tag), type_code::map);
            std::size_t pos = 0;
            const auto head = parse_head(out, pos);
            CHECK(head.tag == tag);
            CHECK(head.type == type_code::map);
            CHECK(pos == out.size());
        }
    }

    TEST_CASE("malformed headers") {
        SUBCASE("type 14 is not a type") {
            const auto data = bytes({ 0x0E });
            std::size_t pos = 0;
            try {
                parse_head(data, pos);
                FAIL("expected invalid_type_error");
            }
            catch (const invalid_type_error& e) {
                CHECK(e.type_id() == 14);
                CHECK(e.offset() == 0);
                CHECK(e.errc() == error_code::invalid_type);
            }
            CHECK(pos == 0);
        }
        SUBCASE("missing extended tag byte") {
            const auto data = bytes({ 0x00, 0xF2 });
            std::size_t pos = 1;
            try {
                parse_head(data, pos);
                FAIL("expected buffer_overflow_error");
            }
            catch (const buffer_overflow_error& e) {
                CHECK(e.offset() == 2);
                CHECK(std::string(e.what()) == "Unexpected end of buffer at offset 2");
            }
        }
        SUBCASE("empty input") {
            byte_buffer data;
            std::size_t pos = 0;
            CHECK_THROWS_AS(parse_head(data, pos), buffer_overflow_error);
        }
    }
}
