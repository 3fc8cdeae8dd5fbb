#include "path/PathValue.hpp"

#include <doctest/doctest.h>

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

using namespace TP;

namespace {

auto key(char const* value) -> Segment {
    return Segment{std::string{value}};
}

auto idx(std::int64_t value) -> Segment {
    return Segment{value};
}

} // namespace

TEST_SUITE("path.path_value") {

TEST_CASE("construction splits text on the separator") {
    PathValue path("a/b/c");
    REQUIRE(path.size() == 3);
    CHECK(path.parts()[0] == key("a"));
    CHECK(path.parts()[2] == key("c"));
    CHECK(path.str() == "a/b/c");
    CHECK(path.separator() == '/');
}

TEST_CASE("empty tokens and dots are dropped") {
    CHECK(PathValue("a//b/./c/").str() == "a/b/c");
    CHECK(PathValue("/").empty());
    CHECK(PathValue(".").empty());
    CHECK(PathValue("").empty());
    CHECK(PathValue().str().empty());
}

TEST_CASE("custom separator parses and renders with that separator") {
    PathValue dotted("a.b.c", '.');
    REQUIRE(dotted.size() == 3);
    CHECK(dotted.str() == "a.b.c");
    CHECK(dotted.asPosix() == "a/b/c");

    // A slash is an ordinary character under another separator.
    PathValue slashInKey("x/y.z", '.');
    REQUIRE(slashInKey.size() == 2);
    CHECK(slashInKey.parts()[0] == key("x/y"));
}

TEST_CASE("parse round-trips the rendered form") {
    for (auto const* input : {"a", "a/b", "one/two/three/four"}) {
        auto const path = PathValue::parse(input);
        CHECK(PathValue::parse(path.str()) == path);
    }
    auto const custom = PathValue::parse("x:y:z", ':');
    CHECK(PathValue::parse(custom.str(), ':') == custom);
}

TEST_CASE("integer segments are preserved as integers") {
    PathValue path({key("items"), idx(0), key("name")});
    REQUIRE(path.size() == 3);
    CHECK(isIndex(path.parts()[1]));
    CHECK(path.str() == "items/0/name");

    PathValue textual("items/0/name");
    CHECK_FALSE(isIndex(textual.parts()[1]));
    CHECK(path != textual);
}

TEST_CASE("join and operator/ compose like a single construction") {
    PathValue const base("a");
    auto const      joined = base / "b/c";
    CHECK(joined == PathValue("a/b/c"));
    CHECK(base.join(idx(2)).parts().back() == idx(2));
    CHECK((base / PathValue("x/y")) == PathValue("a/x/y"));
    CHECK(base.str() == "a");

    // Joining the empty path is the identity both ways.
    CHECK((base / PathValue()) == base);
    CHECK((PathValue() / base) == base);
}

TEST_CASE("parent undoes a single-segment join") {
    PathValue const base({key("root"), idx(4)});
    for (auto const& segment : {key("leaf"), idx(0), idx(-2), key("0")}) {
        auto up = base.join(segment).parent();
        REQUIRE(up.has_value());
        CHECK(*up == base);
    }
}

TEST_CASE("join keeps the left separator") {
    PathValue const dotted("a.b", '.');
    auto const      joined = dotted / PathValue("c/d");
    CHECK(joined.separator() == '.');
    CHECK(joined.str() == "a.b.c.d");
}

TEST_CASE("prepend and appendVerbatim") {
    PathValue const path("b/c");
    CHECK(path.prepend(key("a")) == PathValue("a/b/c"));
    CHECK(path.prepend(idx(7)).parts().front() == idx(7));

    auto const verbatim = path.appendVerbatim(key("d/e"));
    REQUIRE(verbatim.size() == 3);
    CHECK(verbatim.parts().back() == key("d/e"));
}

TEST_CASE("parent and parents") {
    PathValue const path("a/b/c");
    auto            up = path.parent();
    REQUIRE(up.has_value());
    CHECK(*up == PathValue("a/b"));

    auto const chain = path.parents();
    REQUIRE(chain.size() == 3);
    CHECK(chain[0] == PathValue("a/b"));
    CHECK(chain[1] == PathValue("a"));
    CHECK(chain[2].empty());

    auto none = PathValue().parent();
    REQUIRE_FALSE(none.has_value());
    CHECK(none.error().code == Error::Code::EmptyPath);
    CHECK(PathValue().parents().empty());
}

TEST_CASE("name, stem and suffix follow file naming rules") {
    PathValue const archive("dir/archive.tar.gz");
    CHECK(archive.name() == "archive.tar.gz");
    CHECK(archive.stem() == "archive.tar");
    CHECK(archive.suffix() == ".gz");
    CHECK((archive.suffixes() == std::vector<std::string>{".tar", ".gz"}));

    PathValue const hidden("home/.bashrc");
    CHECK(hidden.stem() == ".bashrc");
    CHECK(hidden.suffix().empty());
    CHECK(hidden.suffixes().empty());

    PathValue const plain("a/readme");
    CHECK(plain.suffix().empty());
    CHECK(PathValue().name().empty());
    CHECK(PathValue({key("list"), idx(3)}).name() == "3");
}

TEST_CASE("withName and withSuffix") {
    PathValue const path("docs/report.txt");
    auto            renamed = path.withName("summary.md");
    REQUIRE(renamed.has_value());
    CHECK(renamed->str() == "docs/summary.md");

    auto resuffixed = path.withSuffix(".csv");
    REQUIRE(resuffixed.has_value());
    CHECK(resuffixed->str() == "docs/report.csv");

    auto stripped = path.withSuffix("");
    REQUIRE(stripped.has_value());
    CHECK(stripped->str() == "docs/report");

    CHECK(path.withName("").error().code == Error::Code::InvalidName);
    CHECK(path.withName("a/b").error().code == Error::Code::InvalidName);
    CHECK(path.withName(".").error().code == Error::Code::InvalidName);
    CHECK(path.withSuffix("csv").error().code == Error::Code::InvalidName);
    CHECK(PathValue().withName("x").error().code == Error::Code::InvalidName);
}

TEST_CASE("withName results survive a round trip") {
    PathValue const path("a/b");
    for (auto const* name : {"c", "..", ".hidden", "x.tar.gz"}) {
        auto renamed = path.withName(name);
        REQUIRE(renamed.has_value());
        CHECK(renamed->size() == 2);
        CHECK(renamed->name() == name);
        CHECK(PathValue::parse(renamed->str()) == *renamed);
    }

    auto dot = path.withName(".");
    REQUIRE_FALSE(dot.has_value());
    CHECK(dot.error().code == Error::Code::InvalidName);
}

TEST_CASE("relativeTo strips a common prefix") {
    PathValue const path("a/b/c");
    auto            rel = path.relativeTo(PathValue("a"));
    REQUIRE(rel.has_value());
    CHECK(*rel == PathValue("b/c"));

    auto self = path.relativeTo(path);
    REQUIRE(self.has_value());
    CHECK(self->empty());

    CHECK(path.isRelativeTo(PathValue()));
    CHECK_FALSE(path.isRelativeTo(PathValue("a/b/c/d")));
}

TEST_CASE("relativeTo reports a mismatch") {
    PathValue const path("a/b/c");
    auto            rel = path.relativeTo(PathValue("x/y"));
    REQUIRE_FALSE(rel.has_value());
    CHECK(rel.error().code == Error::Code::PathMismatch);
    CHECK(rel.error().message == "'a/b/c' is not in the subpath of 'x/y'");

    // Differently typed segments do not match.
    PathValue const indexed({key("a"), idx(0)});
    CHECK_FALSE(indexed.isRelativeTo(PathValue("a/0")));
    // Nor do paths with different separators.
    CHECK_FALSE(PathValue("a.b", '.').isRelativeTo(PathValue("a")));
}

TEST_CASE("equality and hashing consider separator and segment kind") {
    CHECK(PathValue("a/b") == PathValue({key("a"), key("b")}));
    CHECK(PathValue("a/b") != PathValue("a/b", '.'));
    CHECK(PathValue({idx(1)}) != PathValue("1"));

    std::unordered_set<PathValue> seen;
    seen.insert(PathValue("a/b"));
    seen.insert(PathValue("a//b"));
    seen.insert(PathValue({idx(1)}));
    seen.insert(PathValue("1"));
    CHECK(seen.size() == 3);
    CHECK(PathValue("a/b").hash() == PathValue("a/./b").hash());
}

TEST_CASE("ordering is total across mixed segment kinds") {
    std::vector<PathValue> paths{
        PathValue("b"),
        PathValue({idx(10)}),
        PathValue("a/c"),
        PathValue({key("a"), idx(2)}),
        PathValue("a"),
        PathValue({idx(2)}),
        PathValue(),
    };
    std::ranges::sort(paths);

    std::vector<PathValue> const expected{
        PathValue(),
        PathValue({idx(2)}),
        PathValue({idx(10)}),
        PathValue("a"),
        PathValue({key("a"), idx(2)}),
        PathValue("a/c"),
        PathValue("b"),
    };
    CHECK(paths == expected);

    for (std::size_t i = 0; i + 1 < paths.size(); ++i) {
        CHECK(paths[i] < paths[i + 1]);
        CHECK_FALSE(paths[i + 1] < paths[i]);
    }
}

TEST_CASE("stream output uses the rendered form") {
    std::ostringstream out;
    out << PathValue("x:y", ':');
    CHECK(out.str() == "x:y");
}

} // TEST_SUITE
