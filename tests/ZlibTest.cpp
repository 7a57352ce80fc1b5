#include "bcproxy/zlib/Zlib.hpp"

#include <catch2/catch.hpp>

#include <string>

using namespace bcproxy::zlib;

TEST_CASE("Inflate stream", "[Zlib]") {
    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "You are standing in the town square.\r\n";
    }

    SECTION("inflates what deflate produced, in small pieces") {
        DeflateStream deflater;
        const auto compressed = deflater.write(text, FlushMode::sync);

        InflateStream inflater;
        std::string out;
        for (std::size_t i = 0; i < compressed.size(); i += 7) {
            auto piece = std::string_view(compressed).substr(i, 7);
            auto result = inflater.write(piece, out);
            CHECK(result.consumed == piece.size());
            CHECK(!result.stream_end);
        }
        CHECK(out == text);
    }
    SECTION("reports where the compressed stream ends") {
        DeflateStream deflater;
        auto compressed = deflater.write(text, FlushMode::none);
        compressed += deflater.finish();
        const std::string plain_tail = "plain after";

        InflateStream inflater;
        std::string out;
        auto result = inflater.write(compressed + plain_tail, out);
        CHECK(result.stream_end);
        CHECK(result.consumed == compressed.size());
        CHECK(out == text);
        CHECK(inflater.ended());
    }
    SECTION("garbage is an error") {
        InflateStream inflater;
        std::string out;
        CHECK_THROWS_AS(inflater.write(std::string_view("this is not zlib"), out), std::runtime_error);
    }
    SECTION("reset starts a new stream") {
        DeflateStream first;
        auto one = first.write("one", FlushMode::none);
        one += first.finish();

        InflateStream inflater;
        std::string out;
        inflater.write(one, out);
        REQUIRE(inflater.ended());
        inflater.reset();
        CHECK(!inflater.ended());

        DeflateStream second;
        auto two = second.write("two", FlushMode::sync);
        inflater.write(two, out);
        CHECK(out == "onetwo");
    }
}
