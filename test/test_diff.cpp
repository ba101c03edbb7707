// test_diff.cpp - Tests for change sets and the line-patch verdict

#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

#include "ym_diff.hh"

using ym::parse_document;

namespace {

std::vector<std::string> change_paths(const ym::ChangeSet& cs) {
    std::vector<std::string> out;
    for (const auto& c : cs.changes) out.push_back(c.path);
    return out;
}

}  // namespace

TEST_CASE("diff of identical documents is empty", "[diff][empty]") {
    auto doc = parse_document("a: 1\nb:\n  c: [1, 2]\n");
    auto cs = ym::diff_documents(doc, doc);
    REQUIRE(cs.empty());
    REQUIRE(cs.line_patchable);
}

TEST_CASE("diff records leaf changes", "[diff][changes]") {
    auto before = parse_document("db:\n  host: a\n  port: 1\nname: x\n");

    SECTION("modified scalar") {
        auto after = parse_document("db:\n  host: b\n  port: 1\nname: x\n");
        auto cs = ym::diff_documents(before, after);
        REQUIRE(change_paths(cs) == std::vector<std::string>{"db.host"});
        REQUIRE(cs.changes[0].value.get_value<std::string>() == "b");
        REQUIRE(cs.removed.empty());
        REQUIRE(cs.line_patchable);
    }

    SECTION("added top-level key") {
        auto after = parse_document("db:\n  host: a\n  port: 1\nname: x\nnew: 1\n");
        auto cs = ym::diff_documents(before, after);
        REQUIRE(change_paths(cs) == std::vector<std::string>{"new"});
        REQUIRE(cs.line_patchable);
    }

    SECTION("added nested key") {
        auto after = parse_document("db:\n  host: a\n  port: 1\n  user: u\nname: x\n");
        auto cs = ym::diff_documents(before, after);
        REQUIRE(change_paths(cs) == std::vector<std::string>{"db.user"});
        REQUIRE(cs.line_patchable);
    }

    SECTION("scalar replaced by a sequence") {
        auto after = parse_document("db:\n  host: a\n  port: 1\nname: [x, y]\n");
        auto cs = ym::diff_documents(before, after);
        REQUIRE(change_paths(cs) == std::vector<std::string>{"name"});
        REQUIRE(cs.changes[0].value.is_sequence());
        REQUIRE(cs.line_patchable);
    }

    SECTION("find_change") {
        auto after = parse_document("db:\n  host: b\n  port: 1\nname: x\n");
        auto cs = ym::diff_documents(before, after);
        REQUIRE(cs.find_change("db.host") != nullptr);
        REQUIRE(cs.find_change("db") == nullptr);
    }
}

TEST_CASE("diff records removals at the highest level", "[diff][removed]") {
    auto before = parse_document(
        "keep: 1\n"
        "gone:\n"
        "  a: 1\n"
        "  b: 2\n"
        "db:\n"
        "  user: u\n"
        "  password: p\n");
    auto after = parse_document("keep: 1\ndb:\n  user: u\n");

    auto cs = ym::diff_documents(before, after);
    REQUIRE(cs.removed == std::vector<std::string>{"gone", "db.password"});
    REQUIRE(cs.changes.empty());
    REQUIRE(cs.line_patchable);

    REQUIRE(cs.is_removed("gone"));
    REQUIRE(cs.is_removed("gone.a"));
    REQUIRE_FALSE(cs.is_removed("gone_too"));
    REQUIRE_FALSE(cs.is_removed("db.user"));
}

TEST_CASE("line-patch verdict", "[diff][verdict]") {
    SECTION("new mapping value is structural") {
        auto before = parse_document("a: 1\n");
        auto after = parse_document("a: 1\nb:\n  c: 1\n");
        REQUIRE_FALSE(ym::is_line_patchable(before, after));
    }

    SECTION("scalar turning into a mapping is structural") {
        auto before = parse_document("a: 1\n");
        auto after = parse_document("a:\n  b: 1\n");
        REQUIRE_FALSE(ym::is_line_patchable(before, after));
    }

    SECTION("mapping turning into a scalar is structural") {
        auto before = parse_document("a:\n  b: 1\n");
        auto after = parse_document("a: 1\n");
        REQUIRE_FALSE(ym::is_line_patchable(before, after));
    }

    SECTION("non-mapping roots") {
        auto seq = parse_document("- 1\n- 2\n");
        auto other = parse_document("- 1\n- 3\n");
        REQUIRE(ym::is_line_patchable(seq, seq));
        REQUIRE_FALSE(ym::is_line_patchable(seq, other));
    }

    SECTION("keys a dotted path cannot name") {
        auto before = parse_document("a.b: 1\n");
        auto after = parse_document("a.b: 2\n");
        REQUIRE_FALSE(ym::is_line_patchable(before, after));

        auto ints = parse_document("1: one\nx: 1\n");
        REQUIRE_FALSE(ym::is_line_patchable(ints, parse_document("1: two\nx: 1\n")));
        REQUIRE_FALSE(ym::is_line_patchable(ints, parse_document("x: 1\n")));
        REQUIRE_FALSE(ym::is_line_patchable(parse_document("x: 1\n"), ints));
    }

    SECTION("untouched keys a dotted path cannot name") {
        auto before = parse_document("a.b: 1\n1: one\nname: x\n");
        REQUIRE(ym::is_line_patchable(before, before));

        auto after = parse_document("a.b: 1\n1: one\nname: y\n");
        REQUIRE(ym::is_line_patchable(before, after));

        auto cs = ym::diff_documents(before, after);
        REQUIRE(cs.line_patchable);
        REQUIRE(cs.changes.size() == 1);
        REQUIRE(cs.changes[0].path == "name");
    }

    SECTION("new sequence values are fine") {
        auto before = parse_document("a: 1\n");
        auto after = parse_document("a: 1\nb: [1, 2]\n");
        REQUIRE(ym::is_line_patchable(before, after));
    }
}
