#include "bcproxy/bc/ControlCode.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace bcproxy::bc;

namespace {

std::vector<Unit> drain(ControlCodeReader& reader) {
    std::vector<Unit> out;
    for (;;) {
        auto unit = reader.next();
        REQUIRE(unit);
        if (!unit->has_value()) {
            return out;
        }
        out.push_back(std::move(**unit));
    }
}

ControlCode code(std::string id, std::string attribute, std::string body) {
    return ControlCode{std::move(id), std::move(attribute), std::move(body)};
}

}

TEST_CASE("Control code reader", "[ControlCode]") {
    ControlCodeReader reader;

    SECTION("plain text passes through") {
        reader.feed("hello\r\n");
        auto units = drain(reader);
        REQUIRE(units.size() == 1);
        CHECK(std::get<Text>(units[0]).bytes == "hello\r\n");
        CHECK(reader.idle());
    }

    SECTION("codes may arrive split across reads") {
        reader.feed("\x1b<6");
        CHECK(drain(reader).empty());
        reader.feed("0Town\x1b>");
        CHECK(drain(reader).empty());
        CHECK_FALSE(reader.idle());
        reader.feed("60rest");
        auto units = drain(reader);
        REQUIRE(units.size() == 2);
        CHECK(std::get<ControlCode>(units[0]) == code("60", "", "Town"));
        CHECK(std::get<Text>(units[1]).bytes == "rest");
    }

    SECTION("the part before ESC| is the attribute") {
        reader.feed("\x1b<10spec_prompt\x1b|HP: 100\x1b>10");
        auto units = drain(reader);
        REQUIRE(units.size() == 1);
        CHECK(std::get<ControlCode>(units[0]) == code("10", "spec_prompt", "HP: 100"));
    }

    SECTION("nested codes render into the enclosing body") {
        reader.feed("\x1b<60Room \x1b<22Square\x1b>22\x1b>60");
        auto units = drain(reader);
        REQUIRE(units.size() == 1);
        CHECK(std::get<ControlCode>(units[0]) == code("60", "", "Room \x1b[1mSquare\x1b[0m"));
    }

    SECTION("closes that match nothing are discarded") {
        reader.feed("\x1b<60abc\x1b>61def\x1b>60x\x1b>70y");
        auto units = drain(reader);
        REQUIRE(units.size() == 3);
        CHECK(std::get<ControlCode>(units[0]) == code("60", "", "abcdef"));
        CHECK(std::get<Text>(units[1]).bytes == "x");
        CHECK(std::get<Text>(units[2]).bytes == "y");
    }

    SECTION("other escapes are left alone") {
        reader.feed("\x1b[1mbold\x1b<60\x1b[31mred\x1b>60");
        std::string text;
        std::vector<ControlCode> codes;
        for (auto& unit : drain(reader)) {
            if (auto* t = std::get_if<Text>(&unit)) {
                text += t->bytes;
            } else {
                codes.push_back(std::get<ControlCode>(unit));
            }
        }
        CHECK(text == "\x1b[1mbold");
        REQUIRE(codes.size() == 1);
        CHECK(codes[0].body == "\x1b[31mred");
    }

    SECTION("an open code at end of stream is truncated") {
        reader.feed("\x1b<60abc");
        CHECK(drain(reader).empty());
        auto unit = reader.finish();
        REQUIRE_FALSE(unit);
        CHECK(unit.error() == ControlCodeError::truncated);
        CHECK(reader.idle());
    }

    SECTION("a dangling escape at end of stream is released") {
        reader.feed("abc\x1b<6");
        auto units = drain(reader);
        REQUIRE(units.size() == 1);
        CHECK(std::get<Text>(units[0]).bytes == "abc");

        auto tail = reader.finish();
        REQUIRE(tail);
        REQUIRE(tail->has_value());
        CHECK(std::get<Text>(**tail).bytes == "\x1b<6");
        auto done = reader.finish();
        REQUIRE(done);
        CHECK_FALSE(done->has_value());
    }
}

TEST_CASE("Control code limits", "[ControlCode]") {
    SECTION("nesting depth") {
        ControlCodeReader reader(ControlCodeLimits{2, 1024});
        reader.feed("\x1b<60\x1b<61\x1b<62");
        auto unit = reader.next();
        REQUIRE_FALSE(unit);
        CHECK(unit.error() == ControlCodeError::too_deep);
    }
    SECTION("bytes held open") {
        ControlCodeReader reader(ControlCodeLimits{16, 8});
        reader.feed("\x1b<60" + std::string(20, 'x'));
        auto unit = reader.next();
        REQUIRE_FALSE(unit);
        CHECK(unit.error() == ControlCodeError::too_large);
    }
}

TEST_CASE("Control code rendering", "[ControlCode]") {
    CHECK(render(code("60", "", "Town square")) == "[player_location] Town square\n");
    CHECK(render(code("40", "", "")) == "[player_action_indicator_clear]\n");
    CHECK(render(code("77", "", "x")) == "[unspecified] x\n");
    CHECK(render(code("05", "", "")) == "[login] OK\n");
    CHECK(render(code("06", "", "enter your name")) == "[login] enter your name\n");
    CHECK(render(code("11", "", "")) == "[clear_screen]\n");
    CHECK(render(code("00", "", "")) == "\x1b[0m");
    CHECK(render(code("22", "", "X")) == "\x1b[1mX\x1b[0m");
    CHECK(render(code("20", "ffffff", "white")) == "white");
    CHECK(render(code("30", "http://bat.org", "site")) == "[site](http://bat.org)");
    CHECK(render(code("31", "http://bat.org", "http://bat.org")) == "\x1b[4mhttp://bat.org\x1b[0m");

    SECTION("text codes 10") {
        CHECK(render(code("10", "spec_prompt", "HP: 100")) == "[spec_prompt] HP: 100\n");
        CHECK(render(code("10", "chan_sales", "Bob sells a sword\n")) == "Bob sells a sword\n");
        CHECK(render(code("10", "spec_map", "NoMapSupport")) == "[spec_map] NoMapSupport\n");
        CHECK(render(code("10", "spec_map", "ab\ncd\n")) == "[spec_map:0] ab\n[spec_map:1] cd\n");
        CHECK(render(code("10", "spec_other", "z")) == "[spec_other] z");
    }
    SECTION("custom info 99") {
        CHECK(render(code("99", "", "BAT_MAPPER;;room;;x")) == "[bat_mapper] room;;x");
        CHECK(render(code("99", "", "a\nb")) == "[custom_info:0] a\n[custom_info:1] b\n");
    }
}

TEST_CASE("Control code plain text", "[ControlCode]") {
    CHECK(plain_text(code("60", "", "Town")).empty());
    CHECK(plain_text(code("22", "", "bold")) == "bold");
    CHECK(plain_text(code("10", "chan_sales", "hi")) == "hi");
}
