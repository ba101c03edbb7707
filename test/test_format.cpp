// test_format.cpp - Tests for inline value formatting and result lines

#include <catch2/catch_all.hpp>

#include <limits>
#include <string>

#include "ym_format.hh"

using ym::ordered_node;
using ym::parse_document;

TEST_CASE("format_inline_value scalars", "[format][inline]") {
    SECTION("integers and booleans") {
        REQUIRE(ym::format_inline_value(ordered_node(std::int64_t(5433))) == "5433");
        REQUIRE(ym::format_inline_value(ordered_node(std::int64_t(-2))) == "-2");
        REQUIRE(ym::format_inline_value(ordered_node(true)) == "true");
        REQUIRE(ym::format_inline_value(ordered_node(false)) == "false");
    }

    SECTION("null") {
        REQUIRE(ym::format_inline_value(ordered_node()) == "null");
    }

    SECTION("floats keep a decimal point") {
        REQUIRE(ym::format_inline_value(ordered_node(1.5)) == "1.5");
        REQUIRE(ym::format_inline_value(ordered_node(3.0)) == "3.0");
        REQUIRE(ym::format_inline_value(ordered_node(0.1)) == "0.1");
    }

    SECTION("special floats") {
        using lim = std::numeric_limits<double>;
        REQUIRE(ym::format_inline_value(ordered_node(lim::quiet_NaN())) == ".nan");
        REQUIRE(ym::format_inline_value(ordered_node(lim::infinity())) == ".inf");
        REQUIRE(ym::format_inline_value(ordered_node(-lim::infinity())) == "-.inf");
    }

    SECTION("empty containers") {
        REQUIRE(ym::format_inline_value(ordered_node::mapping()) == "{}");
        REQUIRE(ym::format_inline_value(ordered_node::sequence()) == "[]");
    }
}

TEST_CASE("format_inline_value strings", "[format][quote]") {
    auto fmt = [](const std::string& s) {
        return ym::format_inline_value(ordered_node(s));
    };

    SECTION("plain text stays plain") {
        REQUIRE(fmt("localhost") == "localhost");
    }

    SECTION("text that would change type is quoted") {
        REQUIRE(fmt("true") == "'true'");
        REQUIRE(fmt("123") == "'123'");
        REQUIRE(fmt("null") == "'null'");
    }

    SECTION("empty and structural text is quoted") {
        REQUIRE(fmt("") == "''");
        REQUIRE(fmt("a: b") == "'a: b'");
        REQUIRE(fmt("#tag") == "'#tag'");
        REQUIRE(fmt("two words") == "'two words'");
    }

    SECTION("single quotes are doubled") {
        REQUIRE(fmt("it's here") == "'it''s here'");
    }

    SECTION("control characters use double quotes") {
        REQUIRE(fmt("line\nbreak") == "\"line\\nbreak\"");
        REQUIRE(fmt("tab\there") == "\"tab\\there\"");
    }
}

TEST_CASE("format_result", "[format][result]") {
    SECTION("scalar string is printed raw") {
        REQUIRE(ym::format_result("db.host", ordered_node(std::string("x y")), 80)
                == "db.host: x y");
    }

    SECTION("null and numbers") {
        REQUIRE(ym::format_result("k", ordered_node(), 80) == "k: null");
        REQUIRE(ym::format_result("k", ordered_node(std::int64_t(1)), 80) == "k: 1");
    }

    SECTION("long lines are truncated to the width") {
        const std::string value(100, 'v');
        const std::string line = ym::format_result("key", ordered_node(value), 20);
        REQUIRE(line.size() == 20);
        REQUIRE(line.substr(0, 5) == "key: ");
        REQUIRE(line.substr(17) == "...");
    }

    SECTION("line that fits is unchanged") {
        REQUIRE(ym::format_result("key", ordered_node(std::string("abc")), 8)
                == "key: abc");
    }

    SECTION("truncation never splits a UTF-8 sequence") {
        // "é" is two bytes; a cut after 12 bytes would land inside one
        std::string value;
        for (int i = 0; i < 20; ++i) value += "\xC3\xA9";
        const std::string line = ym::format_result("k", ordered_node(value), 15);
        REQUIRE(line.size() <= 15);
        REQUIRE(line.substr(line.size() - 3) == "...");
        const std::string body = line.substr(3, line.size() - 6);
        REQUIRE(body.size() % 2 == 0);
    }

    SECTION("mappings are printed as an indented block") {
        auto doc = parse_document("db:\n  host: h\n  port: 1\n");
        const std::string out = ym::format_result("db", doc.at("db"), 80);
        auto lines = ym::internal::split_lines(out);
        REQUIRE(lines.size() >= 3);
        REQUIRE(lines[0] == "db:");
        for (size_t i = 1; i < lines.size(); ++i) {
            if (!lines[i].empty()) REQUIRE(lines[i].substr(0, 2) == "  ");
        }
        REQUIRE(out.find("host: h") != std::string::npos);
    }

    SECTION("blocks are never truncated") {
        auto doc = parse_document("s:\n  - a very long sequence entry value\n");
        const std::string out = ym::format_result("s", doc.at("s"), 10);
        REQUIRE(out.find("a very long sequence entry value") != std::string::npos);
    }

    SECTION("empty containers stay on one line") {
        REQUIRE(ym::format_result("m", ordered_node::mapping(), 80) == "m: {}");
    }
}
