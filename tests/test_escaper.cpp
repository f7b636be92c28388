/**
 * @file test_escaper.cpp
 * @brief Unit tests for UTF-8 validation and string escaping.
 */

#include <catch2/catch.hpp>
#include <msgjson/escaper.hpp>

#include <string>
#include <vector>

using namespace msgjson;

static bool valid(const std::vector<std::uint8_t>& bytes) {
    return is_valid_utf8(bytes.data(), bytes.size());
}

static std::string escaped(const std::string& text, bool escape_slashes = false) {
    std::string out;
    Error result = append_escaped(reinterpret_cast<const std::uint8_t*>(text.data()), text.size(),
                                  out, escape_slashes);
    REQUIRE(result == Error::Ok);
    return out;
}

TEST_CASE("is_valid_utf8 accepts well-formed input", "[escaper]") {
    SECTION("empty") {
        REQUIRE(is_valid_utf8(nullptr, 0));
    }

    SECTION("ASCII") {
        REQUIRE(valid({'a', 'b', 'c', 0x00, 0x7f}));
    }

    SECTION("two-byte sequence") {
        REQUIRE(valid({0xc3, 0xa9})); // U+00E9
    }

    SECTION("three-byte sequences") {
        REQUIRE(valid({0xe2, 0x82, 0xac})); // U+20AC
        REQUIRE(valid({0xe2, 0x80, 0xa8})); // U+2028
        REQUIRE(valid({0xed, 0x9f, 0xbf})); // U+D7FF
        REQUIRE(valid({0xef, 0xbf, 0xbf})); // U+FFFF
    }

    SECTION("four-byte sequences") {
        REQUIRE(valid({0xf0, 0x9f, 0x98, 0x80})); // U+1F600
        REQUIRE(valid({0xf4, 0x8f, 0xbf, 0xbf})); // U+10FFFF
    }
}

TEST_CASE("is_valid_utf8 rejects malformed input", "[escaper]") {
    SECTION("stray continuation byte") {
        REQUIRE_FALSE(valid({0x80}));
        REQUIRE_FALSE(valid({'a', 0xbf}));
    }

    SECTION("truncated sequences") {
        REQUIRE_FALSE(valid({0xc3}));
        REQUIRE_FALSE(valid({0xe2, 0x82}));
        REQUIRE_FALSE(valid({0xf0, 0x9f, 0x98}));
    }

    SECTION("bad continuation byte") {
        REQUIRE_FALSE(valid({0xc3, 0x28}));
        REQUIRE_FALSE(valid({0xe2, 0x82, 0x41}));
    }

    SECTION("overlong forms") {
        REQUIRE_FALSE(valid({0xc0, 0x80}));
        REQUIRE_FALSE(valid({0xc1, 0xbf}));
        REQUIRE_FALSE(valid({0xe0, 0x80, 0xaf}));
        REQUIRE_FALSE(valid({0xf0, 0x80, 0x80, 0xaf}));
    }

    SECTION("surrogates") {
        REQUIRE_FALSE(valid({0xed, 0xa0, 0x80})); // U+D800
        REQUIRE_FALSE(valid({0xed, 0xbf, 0xbf})); // U+DFFF
    }

    SECTION("beyond U+10FFFF") {
        REQUIRE_FALSE(valid({0xf4, 0x90, 0x80, 0x80}));
        REQUIRE_FALSE(valid({0xf5, 0x80, 0x80, 0x80}));
        REQUIRE_FALSE(valid({0xff}));
    }
}

TEST_CASE("append_escaped quoting", "[escaper]") {
    SECTION("plain text") {
        REQUIRE(escaped("abc") == R"("abc")");
    }

    SECTION("empty string") {
        REQUIRE(escaped("") == R"("")");
    }

    SECTION("quote and backslash") {
        REQUIRE(escaped("a\"b") == R"("a\"b")");
        REQUIRE(escaped("a\\b") == R"("a\\b")");
    }

    SECTION("appends to existing output") {
        std::string out = "[";
        const std::uint8_t text[] = {'x'};
        REQUIRE(append_escaped(text, 1, out) == Error::Ok);
        REQUIRE(out == R"([")" "x\"");
    }
}

TEST_CASE("append_escaped control characters", "[escaper]") {
    SECTION("short escapes") {
        REQUIRE(escaped("\b\f\n\r\t") == R"("\b\f\n\r\t")");
    }

    SECTION("other control characters use \\u00XX") {
        REQUIRE(escaped(std::string("\x01", 1)) == R"("\u0001")");
        REQUIRE(escaped(std::string("\x1f", 1)) == R"("\u001f")");
        REQUIRE(escaped(std::string("a\0b", 3)) == R"("a\u0000b")");
    }

    SECTION("DEL passes through") {
        REQUIRE(escaped("\x7f") == "\"\x7f\"");
    }
}

TEST_CASE("append_escaped line and paragraph separators", "[escaper]") {
    SECTION("U+2028 is escaped") {
        std::string out = escaped("a\xe2\x80\xa8" "b");
        REQUIRE(out == R"("a\u2028b")");
        REQUIRE(out.find("\xe2\x80\xa8") == std::string::npos);
    }

    SECTION("U+2029 is escaped") {
        REQUIRE(escaped("\xe2\x80\xa9") == R"("\u2029")");
    }

    SECTION("neighbouring code points pass through") {
        REQUIRE(escaped("\xe2\x80\xa7") == "\"\xe2\x80\xa7\""); // U+2027
        REQUIRE(escaped("\xe2\x80\xaa") == "\"\xe2\x80\xaa\""); // U+202A
        REQUIRE(escaped("\xe2\x82\xac") == "\"\xe2\x82\xac\""); // U+20AC
    }

    SECTION("non-ASCII text is kept raw") {
        REQUIRE(escaped("caf\xc3\xa9") == "\"caf\xc3\xa9\"");
        REQUIRE(escaped("\xf0\x9f\x98\x80") == "\"\xf0\x9f\x98\x80\"");
    }
}

TEST_CASE("append_escaped slashes", "[escaper]") {
    SECTION("kept by default") {
        REQUIRE(escaped("</script>") == R"("</script>")");
    }

    SECTION("escaped on request") {
        REQUIRE(escaped("</script>", true) == R"("<\/script>")");
    }
}

TEST_CASE("append_escaped rejects invalid UTF-8", "[escaper]") {
    std::string out = "prefix";
    const std::uint8_t bad[] = {'o', 'k', 0xc3};
    REQUIRE(append_escaped(bad, sizeof(bad), out) == Error::InvalidEncoding);
    REQUIRE(out == "prefix");
}
