#include <catch2/catch.hpp>
#include <reroute/core/params.hpp>

using namespace reroute;

TEST_CASE("ParamValue truthiness", "[params]") {
    REQUIRE(!ParamValue().truthy());
    REQUIRE(!ParamValue(nullptr).truthy());
    REQUIRE(!ParamValue(false).truthy());
    REQUIRE(ParamValue(true).truthy());
    REQUIRE(ParamValue("").truthy());
    REQUIRE(ParamValue(0).truthy());
    REQUIRE(ParamValue(ParamArray{}).truthy());
}

TEST_CASE("ParamValue to_param", "[params]") {
    SECTION("scalars") {
        REQUIRE(ParamValue("json").to_param() == "json");
        REQUIRE(ParamValue(42).to_param() == "42");
        REQUIRE(ParamValue(int64_t{-7}).to_param() == "-7");
        REQUIRE(ParamValue(true).to_param() == "true");
        REQUIRE(ParamValue(false).to_param() == "false");
    }

    SECTION("arrays join with slashes") {
        ParamValue files(ParamArray{"a", "b", "c"});
        REQUIRE(files.to_param() == "a/b/c");
    }

    SECTION("null and hashes have no string form") {
        REQUIRE(!ParamValue().to_param());
        REQUIRE(!ParamValue(Params{{"a", "b"}}).to_param());
    }
}

TEST_CASE("Params helpers", "[params]") {
    Params recall{{"controller", "people"}, {"id", "1"}};
    Params params{{"id", "2"}, {"format", "json"}};

    SECTION("merge_params lets the overlay win") {
        Params merged = merge_params(recall, params);
        REQUIRE(merged.size() == 3);
        REQUIRE(merged.at("id") == ParamValue("2"));
        REQUIRE(merged.at("controller") == ParamValue("people"));
    }

    SECTION("has_param ignores falsy values") {
        Params p{{"a", "x"}, {"b", false}, {"c", nullptr}};
        REQUIRE(has_param(p, "a"));
        REQUIRE(!has_param(p, "b"));
        REQUIRE(!has_param(p, "c"));
        REQUIRE(!has_param(p, "d"));
    }

    SECTION("inspect renders in key order") {
        Params p{{"id", "abc"}, {"format", nullptr}, {"tags", ParamArray{"a", true}}};
        REQUIRE(inspect(p) == "{format: nil, id: \"abc\", tags: [\"a\", true]}");
        REQUIRE(inspect(Params{}) == "{}");
    }
}
