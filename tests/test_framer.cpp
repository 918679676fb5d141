// tests/test_framer.cpp
#include "tests.hpp"

#include <stdexcept>

#include "jce/core/error.hpp"
#include "jce/stream/framer.hpp"

using namespace jce::core;
using namespace jce::stream;
using jce::tests::bytes;

TEST_SUITE("stream/framer") {

    TEST_CASE("inclusive four byte big endian length") {
        framer f;
        auto buf = bytes({ 0x00, 0x00, 0x00, 0x0A, 1, 2, 3, 4, 5, 6 });

        CHECK(f.check_frame(buf) == 10u);
        CHECK_FALSE(f.check_frame(byte_view(buf).first(9)).has_value());
        CHECK_FALSE(f.check_frame(byte_view(buf).first(3)).has_value());

        buf.push_back(byte{ 0x77 });
        CHECK(f.check_frame(buf) == 10u);
    }

    TEST_CASE("length shorter than its own header") {
        framer f;
        try {
            f.check_frame(bytes({ 0x00, 0x00, 0x00, 0x03 }));
            FAIL("expected frame_error");
        }
        catch (const frame_error& e) {
            CHECK(e.errc() == error_code::frame_invalid_length);
            CHECK(e.length() == 3);
            CHECK(e.limit() == 4);
        }
    }

    TEST_CASE("length over the frame limit") {
        frame_settings settings;
        settings.max_frame_size = 16;
        framer f(settings);
        try {
            f.check_frame(bytes({ 0x00, 0x00, 0x00, 0x20 }));
            FAIL("expected frame_error");
        }
        catch (const frame_error& e) {
            CHECK(e.errc() == error_code::frame_too_large);
            CHECK(e.length() == 32);
            CHECK(e.limit() == 16);
        }
    }

    TEST_CASE("exclusive little endian two byte length") {
        frame_settings settings;
        settings.length_width = 2;
        settings.inclusive_length = false;
        settings.little_endian_length = true;
        framer f(settings);

        CHECK(f.header_size() == 2);
        CHECK(f.check_frame(bytes({ 0x03, 0x00, 'a', 'b', 'c' })) == 5u);
        CHECK_FALSE(f.check_frame(bytes({ 0x03, 0x00, 'a', 'b' })).has_value());
        CHECK(f.check_frame(bytes({ 0x00, 0x00 })) == 2u);
    }

    TEST_CASE("one byte length") {
        frame_settings settings;
        settings.length_width = 1;
        framer f(settings);
        CHECK(f.check_frame(bytes({ 0x02, 0xAA })) == 2u);
        CHECK_THROWS_AS(f.check_frame(bytes({ 0x00 })), frame_error);
    }

    TEST_CASE("encode_frame") {
        const auto body = bytes({ 0x00, 0x01 });
        CHECK(encode_frame(body) == bytes({ 0x00, 0x00, 0x00, 0x06, 0x00, 0x01 }));

        frame_settings exclusive;
        exclusive.length_width = 2;
        exclusive.inclusive_length = false;
        exclusive.little_endian_length = true;
        CHECK(encode_frame(body, exclusive) == bytes({ 0x02, 0x00, 0x00, 0x01 }));

        frame_settings narrow;
        narrow.length_width = 1;
        const byte_buffer big(300, byte{ 0x11 });
        CHECK_THROWS_AS(encode_frame(big, narrow), frame_error);

        frame_settings small;
        small.max_frame_size = 5;
        CHECK_THROWS_AS(encode_frame(body, small), frame_error);
    }

    TEST_CASE("invalid settings") {
        frame_settings settings;
        settings.length_width = 3;
        CHECK_FALSE(settings.has_valid_width());
        CHECK_THROWS_AS(framer{ settings }, std::invalid_argument);
    }

    TEST_CASE("a full frame must fit the buffer") {
        frame_settings settings;
        settings.max_frame_size = 100;
        settings.max_buffer_size = 50;
        CHECK_THROWS_AS(settings.validate(), std::invalid_argument);
        CHECK_THROWS_AS(framer{ settings }, std::invalid_argument);

        settings.max_buffer_size = 100;
        CHECK_NOTHROW(settings.validate());
    }
}
