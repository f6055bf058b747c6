#include <catch2/catch.hpp>
#include <reroute/core/named_captures.hpp>

#include <re2/re2.h>

using namespace reroute;

namespace {

NamedCaptureIndex compile(std::string_view source, NamesDeclaration names = {}) {
    auto index = NamedCaptureIndex::create(source, std::move(names));
    REQUIRE(index);
    return std::move(*index);
}

} // anonymous namespace

TEST_CASE("NamedCaptureIndex without names", "[named_captures]") {
    SECTION("plain regexp") {
        auto re = compile("/foo");
        REQUIRE(re.source() == "/foo");
        REQUIRE(re.names().empty());
        REQUIRE(re.named_captures().empty());
    }

    SECTION("unnamed captures stay anonymous") {
        auto re = compile("/foo/([a-z]+)/([0-9]+)");
        REQUIRE(re.source() == "/foo/([a-z]+)/([0-9]+)");
        REQUIRE(re.capture_count() == 2);
        REQUIRE(re.names().empty());
        REQUIRE(re.named_captures().empty());
    }
}

TEST_CASE("NamedCaptureIndex with declared names", "[named_captures]") {
    SECTION("flat list") {
        auto re = compile("/foo/([a-z]+)/([0-9]+)", CaptureNames{"name", "id"});
        REQUIRE(re.names() == CaptureNames{"name", "id"});
        REQUIRE(re.named_captures() == NamedCaptures{{"name", {1}}, {"id", {2}}});
    }

    SECTION("position mapping") {
        auto re = compile("/foo/([a-z]+)/([0-9]+)", CapturePositions{{"name", 1}, {"id", 2}});
        REQUIRE(re.names() == CaptureNames{"name", "id"});
        REQUIRE(re.named_captures() == NamedCaptures{{"name", {1}}, {"id", {2}}});
    }

    SECTION("nested groups with a list") {
        auto re = compile("/foo/([a-z]+)(/([0-9]+))?", CaptureNames{"name", std::nullopt, "id"});
        REQUIRE(re.source() == "/foo/([a-z]+)(/([0-9]+))?");
        REQUIRE(re.named_captures() == NamedCaptures{{"name", {1}}, {"id", {3}}});
    }

    SECTION("nested groups with a mapping leave gaps") {
        auto re = compile("/foo/([a-z]+)(/([0-9]+))?", CapturePositions{{"name", 1}, {"id", 3}});
        REQUIRE(re.names() == CaptureNames{"name", std::nullopt, "id"});
        REQUIRE(re.named_captures() == NamedCaptures{{"name", {1}}, {"id", {3}}});
    }

    SECTION("positions are 1-based") {
        auto re = NamedCaptureIndex::create("/foo/([a-z]+)", CapturePositions{{"name", 0}});
        REQUIRE(!re);
        REQUIRE(re.error().pattern_error() == PatternError::InvalidRegexp);
    }
}

TEST_CASE("NamedCaptureIndex inline markers", "[named_captures]") {
    SECTION("markers become plain captures") {
        auto re = compile("/foo/(?:<name>[a-z]+)/(?:<id>[0-9]+)");
        REQUIRE(re.source() == "/foo/([a-z]+)/([0-9]+)");
        REQUIRE(re.names() == CaptureNames{"name", "id"});
        REQUIRE(re.named_captures() == NamedCaptures{{"name", {1}}, {"id", {2}}});
    }

    SECTION("nested markers") {
        auto re = compile("/foo/(?:<name>[a-z]+)(/(?:<id>[0-9]+))?");
        REQUIRE(re.source() == "/foo/([a-z]+)(/([0-9]+))?");
        REQUIRE(re.names() == CaptureNames{"name", std::nullopt, "id"});
        REQUIRE(re.named_captures() == NamedCaptures{{"name", {1}}, {"id", {3}}});
    }

    SECTION("non-capturing groups and classes are left alone") {
        auto re = compile("^/(?:a|b)/[(]x[)]/(?:<id>[0-9]+)$");
        REQUIRE(re.source() == "^/(?:a|b)/[(]x[)]/([0-9]+)$");
        REQUIRE(re.named_captures() == NamedCaptures{{"id", {1}}});
    }
}

TEST_CASE("NamedCaptureIndex native named groups", "[named_captures]") {
    SECTION("both spellings are read back from the engine") {
        auto re = compile("/foo/(?<name>[a-z]+)/(?P<id>[0-9]+)");
        REQUIRE(re.source() == "/foo/(?P<name>[a-z]+)/(?P<id>[0-9]+)");
        REQUIRE(re.names() == CaptureNames{"name", "id"});
        REQUIRE(re.named_captures() == NamedCaptures{{"name", {1}}, {"id", {2}}});
    }

    SECTION("unnamed groups keep their positions") {
        auto re = compile("/foo/(?<name>[a-z]+)(/(?<id>[0-9]+))?");
        REQUIRE(re.names() == CaptureNames{"name", std::nullopt, "id"});
        REQUIRE(re.named_captures() == NamedCaptures{{"name", {1}}, {"id", {3}}});
    }

    SECTION("compiled regexp agrees with the index") {
        auto re = compile("^/(?<controller>[a-z]+)$");
        REQUIRE(re.to_regexp().NumberOfCapturingGroups() == 1);
        REQUIRE(re2::RE2::FullMatch("/people", re.to_regexp()));
    }
}

TEST_CASE("NamedCaptureIndex names and positions correspond", "[named_captures]") {
    auto re = compile("^/([a-z]+)/([a-z]+)/([0-9]+)$", CaptureNames{"controller", "action", "id"});

    REQUIRE(re.capture_count() == 3);
    for (const auto& [name, positions] : re.named_captures()) {
        REQUIRE(positions.size() == 1);
        REQUIRE(re.names()[positions[0] - 1] == name);
    }
}

TEST_CASE("NamedCaptureIndex match", "[named_captures]") {
    SECTION("captures by name") {
        auto re = compile("^/people/([^/.?]+)(\\.([^/.?]+))?$", CaptureNames{"id", std::nullopt, "format"});

        auto plain = re.match("/people/1");
        REQUIRE(plain);
        REQUIRE(plain->size() == 1);
        REQUIRE(plain->at("id") == "1");

        auto formatted = re.match("/people/1.json");
        REQUIRE(formatted);
        REQUIRE(formatted->at("id") == "1");
        REQUIRE(formatted->at("format") == "json");

        REQUIRE(!re.match("/people"));
    }

    SECTION("a name declared in two branches reports the one that matched") {
        auto re = compile("^/(?:(?:<id>[0-9]+)|item-(?:<id>[a-z]+))$");
        REQUIRE(re.named_captures() == NamedCaptures{{"id", {1, 2}}});

        auto numeric = re.match("/42");
        REQUIRE(numeric);
        REQUIRE(numeric->at("id") == "42");

        auto slug = re.match("/item-abc");
        REQUIRE(slug);
        REQUIRE(slug->at("id") == "abc");
    }

    SECTION("engine errors surface as pattern errors") {
        auto re = NamedCaptureIndex::create("/foo/([a-z]+");
        REQUIRE(!re);
        REQUIRE(re.error().is_pattern());
        REQUIRE(re.error().pattern_error() == PatternError::InvalidRegexp);
    }
}
