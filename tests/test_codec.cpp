// tests/test_codec.cpp
#include "tests.hpp"

#include <string>

#include "jce/core/error.hpp"
#include "jce/codec/codec.hpp"
#include "jce/codec/writer.hpp"

using namespace jce::core;
using namespace jce::codec;
using jce::tests::bytes;

TEST_SUITE("codec/generic") {

    TEST_CASE("top-level scalars sit under tag 0") {
        CHECK(encode_generic(value(1)) == bytes({ 0x00, 0x01 }));
        CHECK(encode_generic(value(0)) == bytes({ 0x0C }));
        CHECK(encode_generic(value("a")) == bytes({ 0x06, 0x01, 'a' }));
        CHECK(encode_generic(value(bytes({ 'a', 'b', 'c' }))) == bytes({ 0x0D, 0x00, 0x00, 0x03, 'a', 'b', 'c' }));
    }

    TEST_CASE("top-level map becomes a struct body") {
        const value fields(value::map{
            { value("1:name"), value("a") },
            { value(0), value(5) },
            { value("bad"), value(1) },
            { value("300"), value(2) },
            { value(-1), value(3) },
        });
        CHECK(encode_generic(fields) == bytes({ 0x00, 0x05, 0x16, 0x01, 'a' }));
    }

    TEST_CASE("nested maps and lists keep their wire types") {
        value::record rec;
        rec.set(0, value::map{ { value(1), value("a") } });
        rec.set(1, value::list{ 2.0 });

        writer expected;
        expected.write_tag(0, type_code::map);
        expected.write_int(0, 1);
        expected.write_int(0, 1);
        expected.write_string(1, "a");
        expected.write_tag(1, type_code::list);
        expected.write_int(0, 1);
        expected.write_double(0, 2.0);

        const auto out = encode_generic(rec);
        CHECK(out == to_buffer(expected.view()));
        CHECK(decode_generic(out) == value(rec));
    }

    TEST_CASE("null values cannot be encoded") {
        CHECK_THROWS_AS(encode_generic(value{}), codec_error);
        CHECK_THROWS_AS(encode_generic(value(value::record{ { 3, value{} } })), codec_error);
        CHECK_THROWS_AS(encode_generic(value(value::list{ value{} })), codec_error);
    }

    TEST_CASE("decode reads one struct body") {
        SUBCASE("ZeroTag is integer zero") {
            CHECK(decode_generic(bytes({ 0x1C })) == value(value::record{ { 1, value(0) } }));
        }
        SUBCASE("StructEnd stops the body") {
            CHECK(decode_generic(bytes({ 0x00, 0x01, 0x0B, 0x00, 0x02 })) == value(value::record{ { 0, value(1) } }));
        }
        SUBCASE("empty input is an empty record") {
            CHECK(decode_generic(byte_view{}) == value(value::record{}));
        }
        SUBCASE("repeated tags keep the last value") {
            CHECK(decode_generic(bytes({ 0x00, 0x01, 0x00, 0x02 })) == value(value::record{ { 0, value(2) } }));
        }
    }

    TEST_CASE("SimpleList presentation") {
        const auto text = bytes({ 0x0D, 0x00, 0x00, 0x03, 'a', 'b', 'c' });
        const auto control = bytes({ 0x0D, 0x00, 0x00, 0x01, 0x01 });
        const auto nested = bytes({ 0x0D, 0x00, 0x00, 0x02, 0x00, 0x01 });
        const auto junk = bytes({ 0x0D, 0x00, 0x00, 0x02, 0xFF, 0xFE });

        auto field0 = [](const value& rec) { return rec.as_record().at(0); };

        SUBCASE("raw") {
            CHECK(field0(decode_generic(text, option_flags::none, bytes_mode::raw)) == value(bytes({ 'a', 'b', 'c' })));
            CHECK(field0(decode_generic(nested, option_flags::none, bytes_mode::raw)) == value(bytes({ 0x00, 0x01 })));
        }
        SUBCASE("string") {
            CHECK(field0(decode_generic(text, option_flags::none, bytes_mode::string)) == value("abc"));
            CHECK(field0(decode_generic(control, option_flags::none, bytes_mode::string)) == value("\x01"));
            CHECK(field0(decode_generic(junk, option_flags::none, bytes_mode::string)).is_bytes());
        }
        SUBCASE("automatic") {
            CHECK(field0(decode_generic(text)) == value("abc"));
            CHECK(field0(decode_generic(nested)) == value(value::record{ { 0, value(1) } }));
            CHECK(field0(decode_generic(junk)) == value(bytes({ 0xFF, 0xFE })));
            CHECK(field0(decode_generic(control)) == value(bytes({ 0x01 })));
        }
    }

    TEST_CASE("malformed input") {
        SUBCASE("truncated") {
            try {
                decode_generic(bytes({ 0x02, 0x00, 0x00 }));
                FAIL("expected buffer_overflow_error");
            }
            catch (const buffer_overflow_error& e) {
                CHECK(e.errc() == error_code::buffer_overflow);
            }
        }
        SUBCASE("unknown type") {
            try {
                decode_generic(bytes({ 0x00, 0x01, 0x0E }));
                FAIL("expected invalid_type_error");
            }
            catch (const invalid_type_error& e) {
                CHECK(e.type_id() == 14);
                CHECK(e.offset() == 2);
            }
        }
    }

    TEST_CASE("byte order flag") {
        const value rec(value::record{ { 0, value(1000) }, { 1, value(1.5) } });
        const auto le = encode_generic(rec, option_flags::little_endian);
        const auto be = encode_generic(rec);
        CHECK(le != be);
        CHECK(le[1] == byte{ 0xE8 });
        CHECK(decode_generic(le, option_flags::little_endian) == rec);
        CHECK(decode_generic(be) == rec);
    }

    TEST_CASE("option flags") {
        const auto opts = codec_options::from_flags(option_flags::little_endian | option_flags::exclude_unset);
        CHECK(opts.order == endian_mode::little);
        CHECK(opts.exclude_unset);
        CHECK_FALSE(opts.omit_default);
        CHECK(bytes_mode_from_int(0) == bytes_mode::raw);
        CHECK(bytes_mode_from_int(1) == bytes_mode::string);
        CHECK(bytes_mode_from_int(2) == bytes_mode::automatic);
        CHECK(bytes_mode_from_int(7) == bytes_mode::raw);
    }
}
