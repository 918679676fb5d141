// tests/test_reader.cpp
#include "tests.hpp"

#include <string>

#include "jce/core/error.hpp"
#include "jce/codec/reader.hpp"
#include "jce/codec/writer.hpp"

using namespace jce::core;
using namespace jce::codec;
using jce::tests::bytes;

TEST_SUITE("codec/reader") {

    TEST_CASE("primitives written by the writer read back") {
        for (auto order : { endian_mode::big, endian_mode::little }) {
            writer w(order);
            w.write_int(0, 0)
                .write_int(1, -5)
                .write_int(2, 1000)
                .write_int(3, -100000)
                .write_int(4, 1LL << 40)
                .write_float(5, 0.5f)
                .write_double(6, -3.25)
                .write_string(7, "hello");

            reader r(w.view(), order);
            auto h = r.read_head();
            CHECK(h.type == type_code::zero_tag);
            CHECK(r.read_int(h.type) == 0);
            CHECK(r.read_int(r.read_head().type) == -5);
            CHECK(r.read_int(r.read_head().type) == 1000);
            CHECK(r.read_int(r.read_head().type) == -100000);
            CHECK(r.read_int(r.read_head().type) == (1LL << 40));
            CHECK(r.read_head().type == type_code::fp32);
            CHECK(r.read_float() == 0.5f);
            CHECK(r.read_head().type == type_code::fp64);
            CHECK(r.read_double() == -3.25);
            h = r.read_head();
            CHECK(h.tag == 7);
            CHECK(r.read_string(h.type) == "hello");
            CHECK(r.is_end());
        }
    }

    TEST_CASE("peek does not consume") {
        const auto data = bytes({ 0x10, 0x05 });
        reader r(data);
        CHECK(r.peek_head() == field_head{ 1, type_code::int1 });
        CHECK(r.position() == 0);
        CHECK(r.read_head().tag == 1);
        CHECK(r.position() == 1);
    }

    TEST_CASE("strings are views into the input") {
        const auto data = bytes({ 0x06, 0x02, 0x68, 0x69 });
        reader r(data);
        const auto s = r.read_string(r.read_head().type);
        CHECK(s == "hi");
        CHECK(reinterpret_cast<const byte*>(s.data()) == data.data() + 2);
    }

    TEST_CASE("read errors carry offsets") {
        SUBCASE("truncated Int4") {
            const auto data = bytes({ 0x02, 0x00, 0x01 });
            reader r(data);
            const auto h = r.read_head();
            try {
                r.read_int(h.type);
                FAIL("expected overflow");
            }
            catch (const buffer_overflow_error& e) {
                CHECK(e.offset() == 1);
            }
        }
        SUBCASE("string longer than the input") {
            const auto data = bytes({ 0x06, 0x05, 0x61 });
            reader r(data);
            const auto h = r.read_head();
            CHECK_THROWS_AS(r.read_string(h.type), buffer_overflow_error);
            CHECK(r.position() == 1);
        }
        SUBCASE("invalid UTF-8 is a custom error") {
            const auto data = bytes({ 0x06, 0x02, 0xC3, 0x28 });
            reader r(data);
            const auto h = r.read_head();
            try {
                r.read_string(h.type);
                FAIL("expected codec_error");
            }
            catch (const codec_error& e) {
                CHECK(e.errc() == error_code::custom);
                CHECK(e.offset() == 2);
            }
        }
        SUBCASE("int from a string type") {
            const auto data = bytes({ 0x06, 0x00 });
            reader r(data);
            CHECK_THROWS_AS(r.read_int(r.read_head().type), codec_error);
        }
        SUBCASE("negative container size") {
            const auto data = bytes({ 0x00, 0xFF });
            reader r(data);
            try {
                r.read_size();
                FAIL("expected codec_error");
            }
            catch (const codec_error& e) {
                CHECK(e.errc() == error_code::custom);
            }
        }
        SUBCASE("container size wider than Int4") {
            const auto data = bytes({ 0x03, 0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF });
            reader r(data);
            try {
                r.read_size();
                FAIL("expected codec_error");
            }
            catch (const codec_error& e) {
                CHECK(e.errc() == error_code::custom);
                CHECK(e.offset() == 1);
            }
        }
        SUBCASE("SimpleList of something other than bytes") {
            const auto data = bytes({ 0x02, 0x00 });
            reader r(data);
            CHECK_THROWS_AS(r.read_simple_list_marker(), codec_error);
        }
    }

    TEST_CASE("skip_field walks every type") {
        writer w;
        w.write_tag(0, type_code::map).write_int(0, 1)
            .write_string(0, "k").write_bytes(1, bytes({ 1, 2, 3 }));
        w.write_tag(1, type_code::list).write_int(0, 2)
            .write_double(0, 1.0).write_struct_begin(0).write_int(0, 9).write_struct_end();
        w.write_string(2, std::string(300, 'z'));
        w.write_int(3, 42);

        reader r(w.view());
        for (int i = 0; i < 3; ++i) {
            r.skip_field(r.read_head().type);
        }
        const auto h = r.read_head();
        CHECK(h.tag == 3);
        CHECK(r.read_int(h.type) == 42);
        CHECK(r.is_end());
    }

    TEST_CASE("skipping deep nesting hits the depth cap") {
        writer w;
        for (int i = 0; i < 150; ++i) {
            w.write_struct_begin(0);
        }
        for (int i = 0; i < 150; ++i) {
            w.write_struct_end();
        }
        reader r(w.view());
        const auto h = r.read_head();
        try {
            r.skip_field(h.type);
            FAIL("expected depth_exceeded_error");
        }
        catch (const depth_exceeded_error& e) {
            CHECK(e.errc() == error_code::depth_exceeded);
            CHECK(std::string(e.what()) == "Depth exceeded");
        }
    }
}
