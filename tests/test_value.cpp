// tests/test_value.cpp
#include "tests.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "jce/codec/value.hpp"

using namespace jce::core;
using namespace jce::codec;
using jce::tests::bytes;

TEST_SUITE("codec/value") {

    TEST_CASE("kinds") {
        CHECK(value{}.is_null());
        CHECK(value(5).is_int());
        CHECK(value(std::int64_t{ -1 }).as_int() == -1);
        CHECK(value(2.5).is_double());
        CHECK(value(1.5f).as_double() == 1.5);
        CHECK(value("abc").is_text());
        CHECK(value(bytes({ 1 })).is_bytes());
        CHECK(value(value::list{ 1, 2 }).is_list());
        CHECK(value(value::map{}).is_map());
        CHECK(value(value::record{}).is_record());
        CHECK(value(value::object{}).is_object());
        CHECK(value_kind_name(value(1).kind()) == std::string("integer"));
        CHECK_THROWS(value(1).as_text());
    }

    TEST_CASE("unsigned 64-bit input is range checked") {
        CHECK(value(std::uint64_t{ 5 }).as_int() == 5);
        CHECK(value(std::uint32_t{ 4000000000u }).as_int() == 4000000000);
        CHECK(value(static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())).as_int()
            == std::numeric_limits<std::int64_t>::max());
        CHECK_THROWS_AS(value(std::numeric_limits<std::uint64_t>::max()), std::out_of_range);
    }

    TEST_CASE("record keeps tags ordered and unique") {
        value::record rec;
        rec.set(5, "five");
        rec.set(1, 1);
        rec.set(3, 3.0);
        rec.set(1, "one");

        REQUIRE(rec.size() == 3);
        auto it = rec.begin();
        CHECK(it->first == 1);
        CHECK(it->second == value("one"));
        ++it;
        CHECK(it->first == 3);
        ++it;
        CHECK(it->first == 5);

        CHECK(rec.contains(3));
        CHECK(rec.erase(3));
        CHECK_FALSE(rec.erase(3));
        CHECK(rec.find(3) == nullptr);
        CHECK(rec.at(5) == value("five"));
        CHECK_THROWS_AS(rec.at(9), std::out_of_range);
    }

    TEST_CASE("equality") {
        SUBCASE("maps ignore entry order") {
            value a(value::map{ { value("x"), value(1) }, { value("y"), value(2) } });
            value b(value::map{ { value("y"), value(2) }, { value("x"), value(1) } });
            CHECK(a == b);

            value c(value::map{ { value("x"), value(1) }, { value("y"), value(3) } });
            CHECK_FALSE(a == c);
        }
        SUBCASE("lists do not") {
            CHECK(value(value::list{ 1, 2 }) == value(value::list{ 1, 2 }));
            CHECK_FALSE(value(value::list{ 1, 2 }) == value(value::list{ 2, 1 }));
        }
        SUBCASE("integer and double are different kinds") {
            CHECK_FALSE(value(1) == value(1.0));
        }
        SUBCASE("records compare field by field") {
            value::record a{ { 0, value(1) }, { 2, value("s") } };
            value::record b{ { 2, value("s") }, { 0, value(1) } };
            CHECK(value(a) == value(b));
        }
    }

    TEST_CASE("find_key") {
        value m(value::map{ { value(1), value("one") }, { value("k"), value(2) } });
        REQUIRE(m.find_key(1) != nullptr);
        CHECK(*m.find_key(1) == value("one"));
        CHECK(*m.find_key("k") == value(2));
        CHECK(m.find_key("missing") == nullptr);
        CHECK(value(1).find_key(1) == nullptr);
    }

    TEST_CASE("printing") {
        value::record rec{ { 0, value(1) }, { 1, value("a") }, { 2, value(bytes({ 0xAB, 0x01 })) } };
        rec.set(3, value::list{ 1.5, value{} });
        std::ostringstream os;
        os << value(rec);
        CHECK(os.str() == "struct{0: 1, 1: \"a\", 2: b\"ab01\", 3: [1.5, null]}");
    }
}
