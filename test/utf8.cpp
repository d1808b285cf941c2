#include "doctest.h"
#include "unitool/utf8.h"

#include <string_view>

using namespace std::literals;

extern const char* unicode_text;

TEST_SUITE_BEGIN("utf8");

TEST_CASE("code points encode to utf8")
{
    SUBCASE("one byte per width")
    {
        CHECK(utf8encode(0x24) == "$"sv);
        CHECK(utf8encode(0xA2) == "\xC2\xA2"sv);
        CHECK(utf8encode(0x20AC) == "\xE2\x82\xAC"sv);
        CHECK(utf8encode(0x10348) == "\xF0\x90\x8D\x88"sv);
    }

    SUBCASE("edges of the code space")
    {
        CHECK(utf8encode(0xD7FF) == "\xED\x9F\xBF"sv);
        CHECK(utf8encode(0xE000) == "\xEE\x80\x80"sv);
        CHECK(utf8encode(0x10FFFF) == "\xF4\x8F\xBF\xBF"sv);
    }

    SUBCASE("unencodable values become the replacement character")
    {
        auto replacement = "\xEF\xBF\xBD"sv;
        CHECK(utf8encode(0xD800) == replacement);
        CHECK(utf8encode(0xDFFF) == replacement);
        CHECK(utf8encode(0x110000) == replacement);
        CHECK(utf8encode(0xFFFFFFFF) == replacement);
    }

    SUBCASE("every code point in the sample survives a decode")
    {
        std::string rebuilt;
        for (auto cp : utf8to32(unicode_text))
            rebuilt += utf8encode(cp);
        CHECK(rebuilt == std::string_view{unicode_text});
    }
}

TEST_CASE("malformed sequences are rejected")
{
    std::size_t pos = 99;

    SUBCASE("empty and ascii are valid")
    {
        REQUIRE(utf8valid(""sv));
        REQUIRE(utf8valid("hello"sv));
    }

    SUBCASE("mixed text is valid")
    {
        REQUIRE(utf8valid(std::string_view{unicode_text}, &pos));
        REQUIRE(pos == 99);
    }

    SUBCASE("encoded replacement character is valid")
    {
        REQUIRE(utf8valid("\xEF\xBF\xBD"sv));
    }

    SUBCASE("lone continuation byte")
    {
        REQUIRE_FALSE(utf8valid("ab\x80"sv, &pos));
        REQUIRE(pos == 2);
    }

    SUBCASE("overlong encoding")
    {
        REQUIRE_FALSE(utf8valid("\xC0\xAF"sv, &pos));
        REQUIRE(pos == 0);
    }

    SUBCASE("utf-16 surrogate")
    {
        REQUIRE_FALSE(utf8valid("x\xED\xA0\x80"sv, &pos));
        REQUIRE(pos == 1);
    }

    SUBCASE("past U+10FFFF")
    {
        REQUIRE_FALSE(utf8valid("\xF4\x90\x80\x80"sv, &pos));
        REQUIRE(pos == 0);
    }

    SUBCASE("impossible byte")
    {
        REQUIRE_FALSE(utf8valid("ok\xFF"sv, &pos));
        REQUIRE(pos == 2);
    }

    SUBCASE("truncated at end")
    {
        REQUIRE_FALSE(utf8valid("caf\xC3"sv, &pos));
        REQUIRE(pos == 3);
    }

    SUBCASE("missing continuation mid string")
    {
        REQUIRE_FALSE(utf8valid("a\xE2\x82z"sv, &pos));
        REQUIRE(pos == 1);
    }
}

TEST_CASE("strings decode to code points")
{
    SUBCASE("mixed widths")
    {
        auto v = "A\xC3\xA9\xE2\x82\xAC\xF0\x90\x8D\x88"sv;
        auto cps = utf8to32(v);

        REQUIRE(cps.size() == 4);
        CHECK(cps[0] == 0x41);
        CHECK(cps[1] == 0xE9);
        CHECK(cps[2] == 0x20AC);
        CHECK(cps[3] == 0x10348);
        CHECK(utf8length(v) == 4);
    }

    SUBCASE("empty")
    {
        CHECK(utf8to32(""sv).empty());
        CHECK(utf8length(""sv) == 0);
    }

    SUBCASE("truncated tail decodes to replacement")
    {
        auto cps = utf8to32("a\xE2\x82"sv);

        REQUIRE(cps.size() == 2);
        CHECK(cps[0] == 'a');
        CHECK(cps[1] == utf_invalid);
        CHECK(utf8length("a\xE2\x82"sv) == 2);
    }

    SUBCASE("bad bytes between good ones")
    {
        auto cps = utf8to32("x\xFFy"sv);

        REQUIRE(cps.size() == 3);
        CHECK(cps[0] == 'x');
        CHECK(cps[1] == utf_invalid);
        CHECK(cps[2] == 'y');
    }

    SUBCASE("unicode text length matches decoding")
    {
        std::string_view v{unicode_text};
        CHECK(utf8length(v) == utf8to32(v).size());
    }
}

TEST_SUITE_END();
