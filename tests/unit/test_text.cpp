// test_text.cpp - lenient decoding of remote output
// remote programs print whatever they like, decoding must never throw

#include "fastssh/common.hpp"
#include "fastssh/text.hpp"

#include <doctest/doctest.h>

#include <array>
#include <string>

using namespace fastssh;

namespace
{

    constexpr std::string_view FFFD = "\xEF\xBF\xBD";

    [[nodiscard]] auto decode(std::initializer_list<std::uint8_t> raw) -> std::string
    {
        bytes const data{raw};
        return decode_text(data);
    }

} // anonymous namespace

TEST_SUITE("decode_text")
{
    TEST_CASE("ascii passes through")
    {
        CHECK(decode_text(to_bytes("hello\n")) == "hello\n");
    }

    TEST_CASE("empty input")
    {
        CHECK(decode_text(bytes{}).empty());
    }

    TEST_CASE("valid multi-byte sequences pass through")
    {
        std::string const text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x9A\x80";
        CHECK(decode_text(to_bytes(text)) == text);
    }

    TEST_CASE("stray continuation byte is replaced")
    {
        CHECK(decode({'a', 0x80, 'b'}) == "a" + std::string{FFFD} + "b");
    }

    TEST_CASE("invalid lead bytes are replaced")
    {
        CHECK(decode({0xFF}) == FFFD);
        CHECK(decode({0xC0, 0xAF}) == std::string{FFFD} + std::string{FFFD});
    }

    TEST_CASE("overlong and surrogate encodings are rejected")
    {
        // E0 80 80 would be an overlong NUL
        CHECK(decode({0xE0, 0x80, 0x80}).find(FFFD) == 0);
        // ED A0 80 is U+D800
        CHECK(decode({0xED, 0xA0, 0x80}).find(FFFD) == 0);
        // F4 90 80 80 is beyond U+10FFFF
        CHECK(decode({0xF4, 0x90, 0x80, 0x80}).find(FFFD) == 0);
    }

    TEST_CASE("truncated sequence at the end")
    {
        auto const text = decode({'o', 'k', 0xE2, 0x82});
        CHECK(text.starts_with("ok"));
        CHECK(text.find(FFFD) == 2);
    }

    TEST_CASE("NUL bytes are kept")
    {
        auto const text = decode({'a', 0x00, 'b'});
        REQUIRE(text.size() == 3);
        CHECK(text[1] == '\0');
    }
}

TEST_SUITE("split_lines")
{
    TEST_CASE("keeps terminators")
    {
        auto const lines = split_lines("one\ntwo\n");
        REQUIRE(lines.size() == 2);
        CHECK(lines[0] == "one\n");
        CHECK(lines[1] == "two\n");
    }

    TEST_CASE("trailing partial line is kept")
    {
        auto const lines = split_lines("one\npartial");
        REQUIRE(lines.size() == 2);
        CHECK(lines[1] == "partial");
    }

    TEST_CASE("empty text has no lines")
    {
        CHECK(split_lines("").empty());
    }

    TEST_CASE("blank lines survive")
    {
        auto const lines = split_lines("\n\nx\n");
        REQUIRE(lines.size() == 3);
        CHECK(lines[0] == "\n");
        CHECK(lines[1] == "\n");
        CHECK(lines[2] == "x\n");
    }
}
