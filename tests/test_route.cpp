#include <catch2/catch.hpp>
#include <reroute/core/route.hpp>

#include <vector>

using namespace reroute;

namespace {

RouteHandle compile(RouteDefinition definition, size_t index = 0) {
    auto route = Route::compile(std::move(definition), index);
    REQUIRE(route);
    return *route;
}

const std::vector<UrlPart> kPath{UrlPart::PathInfo};
const std::vector<UrlPart> kHostAndPath{UrlPart::Host, UrlPart::PathInfo};

} // anonymous namespace

TEST_CASE("URL part names", "[route]") {
    REQUIRE(url_part_name(UrlPart::Host) == "host");
    REQUIRE(url_part_name(UrlPart::PathInfo) == "path_info");
}

TEST_CASE("Route compilation", "[route]") {
    SECTION("required params and defaults") {
        auto route = compile({
            .path = "/people/:id(.:format)",
            .name = "person",
            .defaults = {{"controller", "people"}, {"action", "show"}},
        }, 3);

        REQUIRE(route->name() == "person");
        REQUIRE(route->index() == 3);
        REQUIRE(route->host() == nullptr);
        REQUIRE(route->required_params() == std::vector<std::string>{"id"});
        REQUIRE(route->required_defaults() ==
                std::vector<std::pair<std::string, std::string>>{{"action", "show"}, {"controller", "people"}});
        REQUIRE(route->significant_params());
        REQUIRE(route->shape() == RouteShape::Dynamic);
    }

    SECTION("segment defaults are not required") {
        auto route = compile({
            .path = "/:controller(/:action)",
            .defaults = {{"action", "index"}},
        });

        REQUIRE(route->required_params() == std::vector<std::string>{"controller"});
        REQUIRE(route->required_defaults().empty());
        REQUIRE(route->generation_keys().empty());
    }

    SECTION("a default on a required segment satisfies it") {
        auto route = compile({
            .path = "/pages/:slug",
            .defaults = {{"slug", "home"}},
        });
        REQUIRE(route->required_params().empty());
        REQUIRE(route->shape() == RouteShape::Static);
    }

    SECTION("static routes") {
        auto route = compile({.path = "/dashboard", .name = "dashboard"});
        REQUIRE(!route->significant_params());
        REQUIRE(route->shape() == RouteShape::Static);
        REQUIRE(route->static_segments() == std::vector<std::string>{"dashboard"});
    }

    SECTION("generation keys") {
        auto route = compile({
            .path = "/:controller/:id",
            .defaults = {{"action", "show"}, {"format", nullptr}},
            .requirements = {{"controller", "^people$"}, {"id", "[0-9]+"}},
        });

        REQUIRE(route->generation_keys() ==
                std::map<std::string, std::string>{{"action", "show"}, {"controller", "people"}});
    }

    SECTION("pattern errors propagate") {
        auto route = Route::compile({.path = "/people(/:id"}, 0);
        REQUIRE(!route);
        REQUIRE(route.error().pattern_error() == PatternError::UnterminatedGroup);
    }

    SECTION("host condition errors propagate") {
        auto route = Route::compile({.path = "/", .host = ":sub)"}, 0);
        REQUIRE(!route);
        REQUIRE(route.error().pattern_error() == PatternError::UnbalancedGroup);
    }
}

TEST_CASE("Route generate", "[route]") {
    auto route = compile({
        .path = "/people/:id(.:format)",
        .defaults = {{"controller", "people"}, {"action", "show"}},
        .requirements = {{"id", "[0-9]+"}},
    });

    SECTION("path only") {
        Params params{{"controller", "people"}, {"action", "show"}, {"id", 1}};
        auto parts = route->generate(kPath, params, {}, {});
        REQUIRE(parts);
        REQUIRE(parts->size() == 1);
        REQUIRE((*parts)[0] == "/people/1");
        REQUIRE(params.empty());
    }

    SECTION("with format") {
        Params params{{"controller", "people"}, {"action", "show"}, {"id", 1}, {"format", "json"}};
        auto parts = route->generate(kPath, params, {}, {});
        REQUIRE(parts);
        REQUIRE((*parts)[0] == "/people/1.json");
    }

    SECTION("leftover params survive") {
        Params params{{"controller", "people"}, {"action", "show"}, {"id", 1}, {"page", 2}};
        auto parts = route->generate(kPath, params, {}, {});
        REQUIRE(parts);
        REQUIRE(params == Params{{"page", 2}});
    }

    SECTION("required defaults must agree") {
        Params params{{"controller", "people"}, {"action", "edit"}, {"id", 1}};
        REQUIRE(!route->generate(kPath, params, {}, {}));
    }

    SECTION("required defaults may come from recall") {
        Params params{{"id", 1}};
        Params recall{{"controller", "people"}, {"action", "show"}};
        auto parts = route->generate(kPath, params, recall, {});
        REQUIRE(parts);
        REQUIRE((*parts)[0] == "/people/1");
    }

    SECTION("requirement failure") {
        Params params{{"controller", "people"}, {"action", "show"}, {"id", "abc"}};
        REQUIRE(!route->generate(kPath, params, {}, {}));
    }

    SECTION("no host condition") {
        Params params{{"controller", "people"}, {"action", "show"}, {"id", 1}};
        auto parts = route->generate(kHostAndPath, params, {}, {});
        REQUIRE(parts);
        REQUIRE(!(*parts)[0]);
        REQUIRE((*parts)[1] == "/people/1");
    }
}

TEST_CASE("Route host condition", "[route]") {
    auto route = compile({
        .path = "/account",
        .host = ":subdomain.example.com",
        .defaults = {{"controller", "accounts"}},
    });

    REQUIRE(route->host() != nullptr);
    REQUIRE(route->required_params() == std::vector<std::string>{"subdomain"});

    SECTION("generates both parts") {
        Params params{{"controller", "accounts"}, {"subdomain", "alice"}};
        auto parts = route->generate(kHostAndPath, params, {}, {});
        REQUIRE(parts);
        REQUIRE((*parts)[0] == "alice.example.com");
        REQUIRE((*parts)[1] == "/account");
        REQUIRE(params.empty());
    }

    SECTION("missing host param fails") {
        Params params{{"controller", "accounts"}};
        REQUIRE(!route->generate(kHostAndPath, params, {}, {}));
    }
}

TEST_CASE("Route recognize", "[route]") {
    auto route = compile({
        .path = "/files/*files",
        .defaults = {{"controller", "files"}},
    });

    auto params = route->recognize("/files/a/b/c");
    REQUIRE(params);
    REQUIRE(params->at("files") == ParamValue("a/b/c"));
    REQUIRE(params->at("controller") == ParamValue("files"));

    REQUIRE(!route->recognize("/other"));
}
